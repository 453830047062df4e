#include "appmgr/gateway/robot_identity.hpp"
#include "appmgr/config/constants.hpp"

#include <random>

namespace appmgr::gateway {

using namespace appmgr::config::constants;

RobotIdentity::RobotIdentity(std::string base_name, std::optional<std::string> suffix)
    : base_(base_name.empty() ? std::string(ROBOT_NAME_DEFAULT) : std::move(base_name)),
      suffix_(std::move(suffix)) {
    if (suffix_ && suffix_->empty()) suffix_.reset();
    effective_ = suffix_ ? base_ + "-" + *suffix_ : base_;
}

RobotIdentity RobotIdentity::create(std::string base_name, bool unique) {
    if (!unique) return RobotIdentity(std::move(base_name));
    return RobotIdentity(std::move(base_name), generate_unique_suffix());
}

std::string RobotIdentity::application_namespace() const {
    return effective_ + "/" + APPLICATION_NAMESPACE;
}

std::string generate_unique_suffix() {
    static constexpr char kHex[] = "0123456789abcdef";
    std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    out.reserve(UNIQUE_SUFFIX_HEX_DIGITS);
    for (std::size_t i = 0; i < UNIQUE_SUFFIX_HEX_DIGITS; ++i) out.push_back(kHex[dist(rng)]);
    return out;
}

} // namespace appmgr::gateway
