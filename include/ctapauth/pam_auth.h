#pragma once

#include <functional>
#include <string>
#include <utility>

#include "ctapauth/user_presence.h"

namespace ctapauth {

// PAM 验证结果
enum class PamResult { SUCCESS, AUTH_FAILED, USER_CANCELLED, ERROR };

// PAM 验证回调（用于显示提示信息）
using PamPromptCallback = std::function<void(const std::string&)>;

class PamAuthenticator {
 public:
  explicit PamAuthenticator(const std::string& service_name = "ctapauth");

  // 执行 PAM 验证，username 为空时使用当前用户
  PamResult authenticate(const std::string& username = "");

  // 设置超时时间（秒），0 表示在调用线程上一直等待。
  // 大于 0 时 PAM 在后台线程运行，超时返回 USER_CANCELLED；
  // 该会话结束前新的 authenticate() 直接返回 USER_CANCELLED。
  void set_timeout(int seconds) { timeout_seconds_ = seconds; }

  // 设置提示回调 (在 PAM 线程中调用)
  void set_prompt_callback(PamPromptCallback callback) {
    prompt_callback_ = std::move(callback);
  }

  // 获取最后的错误信息
  const std::string& last_error() const { return last_error_; }

 private:
  std::string service_name_;
  int timeout_seconds_ = 0;
  std::string last_error_;
  PamPromptCallback prompt_callback_;
};

/**
 * 通过 PAM 做用户在场确认
 *
 * 默认 PAM 栈中配置 howdy 时即为人脸识别。
 * PAM 被禁用时直接返回 default_result；PAM 出错时抛 PresenceError。
 */
class PamUserPresence : public UserPresence {
 public:
  PamUserPresence(std::string service_name, bool use_pam, bool default_result,
                  int timeout_seconds);

  bool approve_make_credential(const std::string& display_name) override;
  bool approve_get_assertion(const std::string& rp_id) override;
  void wink() override;

 private:
  bool verify_user(const std::string& operation);

  std::string service_name_;
  bool use_pam_;
  bool default_result_;
  int timeout_seconds_;
};

}  // namespace ctapauth
