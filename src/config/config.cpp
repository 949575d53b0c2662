// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "config.hpp"

#include <ostream>
#include <sstream>

#include "version.hpp"

namespace rangejoin { namespace config {

const VersionNumber Version {RANGEJOIN_VERSION_MAJOR, RANGEJOIN_VERSION_MINOR, RANGEJOIN_VERSION_PATCH};

std::ostream& operator<<(std::ostream& os, const VersionNumber& version)
{
    os << version.major << '.' << version.minor;
    if (version.patch) os << '.' << *version.patch;
    return os;
}

std::string to_string(const VersionNumber& version)
{
    std::ostringstream ss {};
    ss << version;
    return ss.str();
}

const std::string BugReport {"the rangejoin issue tracker"};

const std::string CopyrightNotice {"Copyright (c) 2015-2021 Daniel Cooke"};

const unsigned CommandLineWidth {72};

} // namespace config
} // namespace rangejoin
