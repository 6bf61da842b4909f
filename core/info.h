/* Copyright (C) 2020-2021 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef INFO_H
#define INFO_H

namespace Upnpc {
static constexpr const char* APP_NAME = "upnpc";
#ifdef QT_DEBUG
static constexpr const char* APP_VERSION = "1.0.0 (debug)";
#else
static constexpr const char* APP_VERSION = "1.0.0";
#endif // QT_DEBUG
static constexpr const char* APP_ID = "upnpc";
static constexpr const char* ORG = "upnpc";
static constexpr const char* USER_AGENT = "upnp-cli/1.0";
static constexpr const char* ENV_PREFIX = "UPNPC_CLI_";
static constexpr const char* CONFIG_DIR = ".upnp_cli";
static constexpr const char* LICENSE = "Mozilla Public License 2.0";
static constexpr const char* LICENSE_SPDX = "MPL-2.0";
}

#endif // INFO_H
