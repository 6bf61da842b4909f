/* Copyright (C) 2020 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef GUMBOTOOLS_H
#define GUMBOTOOLS_H

#include <QString>
#include <QByteArray>
#include <memory>
#include <functional>
#include <vector>
#include <utility>

#include <gumbo.h>

namespace gumbo
{
typedef std::unique_ptr<GumboOutput, std::function<void (GumboOutput*)>> GumboOutput_ptr;
GumboOutput_ptr parseHtmlData(const QByteArray &data);
std::vector<GumboNode*> element_children(GumboNode* node);
GumboNode* search_for_tag_name_one(GumboNode* node, const QString &name);
// Original spelling for unknown tags, normalized name otherwise
QString tag_name(GumboNode* node);
QString node_text(GumboNode* node);
std::vector<std::pair<QString, QString>> attributes(GumboNode* node);
}

#endif // GUMBOTOOLS_H
