#ifndef APPMGR_VERSION_HPP
#define APPMGR_VERSION_HPP

#pragma once

namespace appmgr {

    /// Project semantic version components
    inline constexpr int version_major = 0;
    inline constexpr int version_minor = 3;
    inline constexpr int version_patch = 0;

    /// Combined version string (e.g. "0.3.0")
    inline constexpr const char* version_string = "0.3.0";

} // namespace appmgr

#endif // APPMGR_VERSION_HPP
