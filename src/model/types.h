#pragma once
#include <QtGlobal>

enum class ErrorKind : quint8 {
    Configuration,     // 500
    BadRequest,        // 400
    NotFound,          // 404
    MethodNotAllowed,  // 405
    Upstream,          // upstream status verbatim
    Unavailable,       // 503
    Parse,             // 500
    Internal           // 500
};
