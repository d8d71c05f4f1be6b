#include "ctapauth/user_presence.h"

#include <spdlog/spdlog.h>

namespace ctapauth {

bool FixedUserPresence::approve_make_credential(
    const std::string& display_name) {
  spdlog::info("Presence: 注册请求 ({})，固定结果: {}", display_name,
               result_ ? "允许" : "拒绝");
  return result_;
}

bool FixedUserPresence::approve_get_assertion(const std::string& rp_id) {
  spdlog::info("Presence: 认证请求 ({})，固定结果: {}", rp_id,
               result_ ? "允许" : "拒绝");
  return result_;
}

void FixedUserPresence::wink() { spdlog::info("Presence: wink"); }

}  // namespace ctapauth
