#pragma once
#include <QString>
#include <optional>

// Minimal structural HTML lookups for the one source that has no API.
namespace html_scanner {

struct Anchor {
    QString text;
    QString href;
};

// Inner HTML of the first <tag> element whose class attribute contains
// classFragment. An unclosed element extends to the end of the document.
std::optional<QString> findElementByClass(const QString& html,
                                          const QString& tag,
                                          const QString& classFragment);

// First <a> carrying an href, with its text stripped of markup and trimmed.
std::optional<Anchor> firstAnchorWithHref(const QString& html);

std::optional<QString> attributeValue(const QString& attributes, const QString& name);
QString decodeEntities(const QString& text);

}
