/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#ifndef CHIME_VERSION
#define CHIME_VERSION "undefined"
#endif

namespace chime {

  inline const std::string &buildVersion() {
    static const std::string version{CHIME_VERSION};
    return version;
  }

}  // namespace chime
