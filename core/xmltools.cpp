/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "xmltools.h"

#include <QDebug>
#include <QDomAttr>
#include <QDomDocument>
#include <QDomElement>
#include <QDomNamedNodeMap>
#include <QDomNode>
#include <QDomNodeList>
#include <QRegularExpression>

#include "gumbotools.h"

static QString localName(const QString &name)
{
    auto idx = name.lastIndexOf(':');
    return idx < 0 ? name : name.mid(idx + 1);
}

bool XmlNode::isNull() const
{
    return name.isEmpty();
}

bool XmlNode::is(const QString &tag) const
{
    return name.compare(tag, Qt::CaseInsensitive) == 0;
}

const XmlNode* XmlNode::child(const QString &tag) const
{
    for (const auto &c : children) {
        if (c.is(tag))
            return &c;
    }
    return nullptr;
}

std::vector<const XmlNode*> XmlNode::childrenNamed(const QString &tag) const
{
    std::vector<const XmlNode*> nodes;
    for (const auto &c : children) {
        if (c.is(tag))
            nodes.push_back(&c);
    }
    return nodes;
}

const XmlNode* XmlNode::find(const QString &tag) const
{
    if (is(tag))
        return this;

    for (const auto &c : children) {
        if (auto n = c.find(tag))
            return n;
    }

    return nullptr;
}

static void findAllImpl(const XmlNode &node, const QString &tag, std::vector<const XmlNode*> *nodes)
{
    if (node.is(tag))
        nodes->push_back(&node);
    for (const auto &c : node.children)
        findAllImpl(c, tag, nodes);
}

std::vector<const XmlNode*> XmlNode::findAll(const QString &tag) const
{
    std::vector<const XmlNode*> nodes;
    findAllImpl(*this, tag, &nodes);
    return nodes;
}

QString XmlNode::childText(const QString &tag, const QString &defaultValue) const
{
    auto c = child(tag);
    return c ? c->text : defaultValue;
}

QString XmlNode::childText(const QStringList &tags, const QString &defaultValue) const
{
    for (const auto &tag : tags) {
        if (auto c = child(tag))
            return c->text;
    }
    return defaultValue;
}

QString XmlNode::attribute(const QString &attrName, const QString &defaultValue) const
{
    for (const auto& [key, value] : attributes) {
        if (key.compare(attrName, Qt::CaseInsensitive) == 0)
            return value;
    }
    return defaultValue;
}

bool XmlNode::hasAttribute(const QString &attrName) const
{
    for (const auto &attr : attributes) {
        if (attr.first.compare(attrName, Qt::CaseInsensitive) == 0)
            return true;
    }
    return false;
}

namespace xmltools {

QString stageName(ParseStage stage)
{
    switch (stage) {
    case ParseStage::Strict:
        return "strict";
    case ParseStage::EscapedEntities:
        return "escaped-entities";
    case ParseStage::Extracted:
        return "extracted";
    case ParseStage::TagSoup:
        return "tag-soup";
    }
    return {};
}

QString sanitize(const QByteArray &data)
{
    static const QRegularExpression ctrlRx{"[\\x{0}-\\x{8}\\x{B}\\x{C}\\x{E}-\\x{1F}\\x{7F}]"};

    auto text = QString::fromUtf8(data);

    // invalid UTF-8 sequences are decoded as U+FFFD
    text.remove(QChar::ReplacementCharacter);
    text.remove(QChar{0xFEFF});
    text.remove(ctrlRx);

    auto start = text.indexOf('<');
    if (start > 0)
        text.remove(0, start);

    return text.trimmed();
}

QString stripNamespaces(const QString &xml)
{
    static const QRegularExpression xmlnsRx{
        R"(\s+xmlns(?::[A-Za-z_][\w.-]*)?\s*=\s*("[^"]*"|'[^']*'))"};
    static const QRegularExpression tagPrefixRx{R"(<(/?)[A-Za-z_][\w.-]*:(?=[A-Za-z_]))"};
    static const QRegularExpression attrPrefixRx{
        R"((\s)[A-Za-z_][\w.-]*:([A-Za-z_][\w.-]*\s*=\s*["']))"};

    auto out = xml;
    out.remove(xmlnsRx);
    out.replace(tagPrefixRx, "<\\1");
    out.replace(attrPrefixRx, "\\1\\2");
    return out;
}

QString escapeBareAmpersands(const QString &xml)
{
    static const QRegularExpression ampRx{
        "&(?!(?:amp|lt|gt|quot|apos|#[0-9]+|#x[0-9a-fA-F]+);)"};

    auto out = xml;
    out.replace(ampRx, "&amp;");
    return out;
}

std::optional<QString> extractRootElement(const QString &xml)
{
    static const QRegularExpression startRx{R"(<([A-Za-z_][\w.:-]*)[\s>/])"};

    auto match = startRx.match(xml);
    if (!match.hasMatch())
        return std::nullopt;

    auto start = match.capturedStart();
    auto close = xml.lastIndexOf("</" + match.captured(1));
    if (close < start)
        return std::nullopt;

    auto end = xml.indexOf('>', close);
    if (end < 0)
        return std::nullopt;

    return xml.mid(start, end - start + 1);
}

XmlNode fromDomElement(const QDomElement &element)
{
    XmlNode node;
    node.name = localName(element.tagName());

    auto attrs = element.attributes();
    for (int i = 0; i < attrs.count(); ++i) {
        auto attr = attrs.item(i).toAttr();
        auto attrName = attr.name();
        if (attrName == "xmlns" || attrName.startsWith("xmlns:"))
            continue;
        node.attributes.emplace_back(localName(attrName), attr.value());
    }

    QString text;
    for (auto n = element.firstChild(); !n.isNull(); n = n.nextSibling()) {
        if (n.isElement())
            node.children.push_back(fromDomElement(n.toElement()));
        else if (n.isText() || n.isCDATASection())
            text.append(n.nodeValue());
    }
    node.text = text.trimmed();

    return node;
}

std::optional<XmlNode> parseStrict(const QString &xml, QString *error)
{
    QDomDocument doc;
    QString msg;
    int line = 0, column = 0;

    if (!doc.setContent(xml, false, &msg, &line, &column)) {
        if (error)
            *error = QStringLiteral("%1 (line %2, column %3)").arg(msg).arg(line).arg(column);
        return std::nullopt;
    }

    auto root = doc.documentElement();
    if (root.isNull()) {
        if (error)
            *error = "Document has no root element";
        return std::nullopt;
    }

    return fromDomElement(root);
}

static XmlNode fromGumboNode(GumboNode* gnode)
{
    XmlNode node;
    node.name = localName(gumbo::tag_name(gnode));
    node.text = gumbo::node_text(gnode);

    for (auto& [key, value] : gumbo::attributes(gnode)) {
        if (key == "xmlns" || key.startsWith("xmlns:"))
            continue;
        node.attributes.emplace_back(localName(key), value);
    }

    for (auto child : gumbo::element_children(gnode))
        node.children.push_back(fromGumboNode(child));

    return node;
}

std::optional<XmlNode> parseTagSoup(const QByteArray &data)
{
    auto output = gumbo::parseHtmlData(data);
    if (!output || !output->root)
        return std::nullopt;

    auto body = gumbo::search_for_tag_name_one(output->root, "body");
    auto roots = gumbo::element_children(body);
    if (roots.empty())
        return std::nullopt;

    return fromGumboNode(roots.front());
}

std::optional<XmlNode> parseWithFallbacks(const QByteArray &data, QString *error,
                                          ParseStage *stage)
{
    auto setStage = [stage](ParseStage s) {
        if (stage)
            *stage = s;
    };

    auto text = sanitize(data);
    if (text.isEmpty() || !text.contains('<')) {
        if (error)
            *error = "Document is empty or contains no markup";
        return std::nullopt;
    }

    text = stripNamespaces(text);

    QString strictError;
    if (auto node = parseStrict(text, &strictError)) {
        setStage(ParseStage::Strict);
        return node;
    }

    qDebug() << "Strict XML parse failed:" << strictError;

    auto escaped = escapeBareAmpersands(text);
    if (escaped != text) {
        if (auto node = parseStrict(escaped)) {
            qDebug() << "XML recovered at stage:" << stageName(ParseStage::EscapedEntities);
            setStage(ParseStage::EscapedEntities);
            return node;
        }
    }

    if (auto extracted = extractRootElement(escaped); extracted && *extracted != escaped) {
        if (auto node = parseStrict(*extracted)) {
            qDebug() << "XML recovered at stage:" << stageName(ParseStage::Extracted);
            setStage(ParseStage::Extracted);
            return node;
        }
    }

    if (auto node = parseTagSoup(escaped.toUtf8())) {
        qDebug() << "XML recovered at stage:" << stageName(ParseStage::TagSoup);
        setStage(ParseStage::TagSoup);
        return node;
    }

    qWarning() << "All XML parse stages failed:" << strictError;

    if (error)
        *error = QStringLiteral("Malformed XML: %1").arg(strictError);

    return std::nullopt;
}
}
