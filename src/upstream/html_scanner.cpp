#include "html_scanner.h"
#include <QRegularExpression>

namespace html_scanner {

namespace {

QString stripTags(const QString& html)
{
    static const QRegularExpression tagPattern(QStringLiteral("<[^>]*>"));
    QString text = html;
    text.remove(tagPattern);
    return text;
}

}

std::optional<QString> attributeValue(const QString& attributes, const QString& name)
{
    const QRegularExpression pattern(
        QStringLiteral("(?:^|\\s)%1\\s*=\\s*(?:\"([^\"]*)\"|'([^']*)'|([^\\s>]+))")
            .arg(QRegularExpression::escape(name)),
        QRegularExpression::CaseInsensitiveOption);
    const QRegularExpressionMatch match = pattern.match(attributes);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    for (int group = 1; group <= 3; ++group) {
        if (match.capturedStart(group) >= 0)
            return decodeEntities(match.captured(group));
    }
    return QString();
}

std::optional<QString> findElementByClass(const QString& html,
                                          const QString& tag,
                                          const QString& classFragment)
{
    const QString escapedTag = QRegularExpression::escape(tag);
    const QRegularExpression openPattern(
        QStringLiteral("<%1\\b([^>]*)>").arg(escapedTag),
        QRegularExpression::CaseInsensitiveOption);
    const QRegularExpression boundaryPattern(
        QStringLiteral("<(/?)%1\\b[^>]*>").arg(escapedTag),
        QRegularExpression::CaseInsensitiveOption);

    QRegularExpressionMatchIterator it = openPattern.globalMatch(html);
    while (it.hasNext()) {
        const QRegularExpressionMatch open = it.next();
        const auto classes = attributeValue(open.captured(1), QStringLiteral("class"));
        if (!classes || !classes->contains(classFragment)) {
            continue;
        }

        const qsizetype contentStart = open.capturedEnd(0);
        int depth = 1;
        QRegularExpressionMatchIterator boundaries = boundaryPattern.globalMatch(html, contentStart);
        while (boundaries.hasNext()) {
            const QRegularExpressionMatch boundary = boundaries.next();
            if (boundary.captured(1).isEmpty()) {
                ++depth;
            } else if (--depth == 0) {
                return html.mid(contentStart, boundary.capturedStart(0) - contentStart);
            }
        }
        return html.mid(contentStart);
    }
    return std::nullopt;
}

std::optional<Anchor> firstAnchorWithHref(const QString& html)
{
    static const QRegularExpression anchorPattern(
        QStringLiteral("<a\\b([^>]*)>(.*?)</a\\s*>"),
        QRegularExpression::CaseInsensitiveOption
            | QRegularExpression::DotMatchesEverythingOption);

    QRegularExpressionMatchIterator it = anchorPattern.globalMatch(html);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        const auto href = attributeValue(match.captured(1), QStringLiteral("href"));
        if (!href) {
            continue;
        }
        Anchor anchor;
        anchor.href = href->trimmed();
        anchor.text = decodeEntities(stripTags(match.captured(2))).simplified();
        return anchor;
    }
    return std::nullopt;
}

QString decodeEntities(const QString& text)
{
    if (!text.contains(QLatin1Char('&'))) {
        return text;
    }

    static const QRegularExpression entityPattern(
        QStringLiteral("&(#[0-9]+|#[xX][0-9a-fA-F]+|[a-zA-Z]+);"));

    QString decoded;
    qsizetype last = 0;
    QRegularExpressionMatchIterator it = entityPattern.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        decoded += text.mid(last, match.capturedStart(0) - last);
        last = match.capturedEnd(0);

        const QString entity = match.captured(1);
        if (entity.startsWith(QLatin1Char('#'))) {
            bool ok = false;
            const uint code = (entity.size() > 1 && (entity.at(1) == QLatin1Char('x') || entity.at(1) == QLatin1Char('X')))
                ? entity.mid(2).toUInt(&ok, 16)
                : entity.mid(1).toUInt(&ok, 10);
            if (ok && code > 0 && code <= 0x10FFFF) {
                const char32_t codePoint = code;
                decoded += QString::fromUcs4(&codePoint, 1);
            } else {
                decoded += match.captured(0);
            }
        } else if (entity == QStringLiteral("amp")) {
            decoded += QLatin1Char('&');
        } else if (entity == QStringLiteral("lt")) {
            decoded += QLatin1Char('<');
        } else if (entity == QStringLiteral("gt")) {
            decoded += QLatin1Char('>');
        } else if (entity == QStringLiteral("quot")) {
            decoded += QLatin1Char('"');
        } else if (entity == QStringLiteral("apos")) {
            decoded += QLatin1Char('\'');
        } else if (entity == QStringLiteral("nbsp")) {
            decoded += QChar(0x00A0);
        } else {
            decoded += match.captured(0);
        }
    }
    decoded += text.mid(last);
    return decoded;
}

}
