/* Copyright (C) 2021 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "gumbotools.h"

#include <QTextStream>

namespace gumbo {

GumboOutput_ptr parseHtmlData(const QByteArray &data)
{
    return GumboOutput_ptr(
                gumbo_parse_with_options(&kGumboDefaultOptions, data.data(),
                size_t(data.length())), [](auto output){
        gumbo_destroy_output(&kGumboDefaultOptions, output);
    });
}

std::vector<GumboNode*> element_children(GumboNode* node)
{
    std::vector<GumboNode*> nodes;

    if (!node || node->type != GUMBO_NODE_ELEMENT) {
        return nodes;
    }

    GumboVector* children = &node->v.element.children;
    for (size_t i = 0; i < children->length; ++i) {
        auto child = static_cast<GumboNode*>(children->data[i]);
        if (child->type == GUMBO_NODE_ELEMENT) {
            nodes.push_back(child);
        }
    }

    return nodes;
}

GumboNode* search_for_tag_name_one(GumboNode* node, const QString &name)
{
    if (!node || node->type != GUMBO_NODE_ELEMENT) {
        return nullptr;
    }

    if (tag_name(node).compare(name, Qt::CaseInsensitive) == 0) {
        return node;
    }

    for (auto child : element_children(node)) {
        GumboNode* result = search_for_tag_name_one(child, name);
        if (result) {
            return result;
        }
    }

    return nullptr;
}

QString tag_name(GumboNode* node)
{
    if (!node || node->type != GUMBO_NODE_ELEMENT) {
        return {};
    }

    if (node->v.element.tag != GUMBO_TAG_UNKNOWN) {
        return QString::fromLatin1(gumbo_normalized_tagname(node->v.element.tag));
    }

    GumboStringPiece piece = node->v.element.original_tag;
    if (!piece.data || piece.length == 0) {
        return {};
    }

    gumbo_tag_from_original_text(&piece);
    return QString::fromUtf8(piece.data, int(piece.length));
}

QString node_text(GumboNode* node)
{
    QString text;
    QTextStream ts(&text);

    if (!node || node->type != GUMBO_NODE_ELEMENT) {
        return {};
    }

    for (size_t i = 0; i < node->v.element.children.length; ++i) {
        auto child = static_cast<GumboNode*>(node->v.element.children.data[i]);
        if (child->type == GUMBO_NODE_TEXT || child->type == GUMBO_NODE_CDATA ||
                child->type == GUMBO_NODE_WHITESPACE) {
            ts << QString::fromUtf8(child->v.text.text);
        }
    }

    ts.flush();
    return text.trimmed();
}

std::vector<std::pair<QString, QString>> attributes(GumboNode* node)
{
    std::vector<std::pair<QString, QString>> attrs;

    if (!node || node->type != GUMBO_NODE_ELEMENT) {
        return attrs;
    }

    const GumboVector* list = &node->v.element.attributes;
    for (size_t i = 0; i < list->length; ++i) {
        auto attr = static_cast<GumboAttribute*>(list->data[i]);
        attrs.emplace_back(QString::fromUtf8(attr->name), QString::fromUtf8(attr->value));
    }

    return attrs;
}
}
