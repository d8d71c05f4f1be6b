#pragma once

#include <string>

namespace ctapauth {

/**
 * 用户在场确认 (User Presence Gate)
 *
 * approve_* 返回 true 表示用户同意，false 表示拒绝、取消或超时；
 * 确认过程本身出错时抛 PresenceError。
 * 实现可能阻塞数秒等待用户操作。
 */
class UserPresence {
 public:
  virtual ~UserPresence() = default;

  // 注册新凭据前确认，display_name 是 RP 的显示名称
  virtual bool approve_make_credential(const std::string& display_name) = 0;

  // 使用凭据签名前确认
  virtual bool approve_get_assertion(const std::string& rp_id) = 0;

  // 让用户看到是哪个设备 (CTAPHID_WINK)
  virtual void wink() = 0;
};

// 固定结果的确认 (测试、无人值守部署)
class FixedUserPresence : public UserPresence {
 public:
  explicit FixedUserPresence(bool result) : result_(result) {}

  bool approve_make_credential(const std::string& display_name) override;
  bool approve_get_assertion(const std::string& rp_id) override;
  void wink() override;

 private:
  bool result_;
};

}  // namespace ctapauth
