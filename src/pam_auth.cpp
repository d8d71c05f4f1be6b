#include "ctapauth/pam_auth.h"

#include <pwd.h>
#include <security/pam_appl.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "ctapauth/ctap_error.h"

namespace ctapauth {

// 一次 PAM 会话的数据，由 PAM 线程独占持有
struct PamSession {
  std::string service_name;
  std::string user;
  PamPromptCallback prompt_callback;
  std::string error;
};

// 是否有 PAM 会话正在进行 (包括超时后仍在后台运行的)
static std::atomic<bool> g_pam_pending{false};

// PAM 会话回调函数
static int pam_conversation(int num_msg, const struct pam_message** msg,
                            struct pam_response** resp, void* appdata_ptr) {
  auto* session = static_cast<PamSession*>(appdata_ptr);

  // 分配响应数组
  *resp = static_cast<pam_response*>(calloc(num_msg, sizeof(pam_response)));
  if (*resp == nullptr) {
    return PAM_BUF_ERR;
  }

  for (int i = 0; i < num_msg; ++i) {
    const auto* m = msg[i];

    switch (m->msg_style) {
      case PAM_PROMPT_ECHO_OFF:
      case PAM_PROMPT_ECHO_ON:
        // 不提供密码，交给 howdy 之类的非交互模块
        (*resp)[i].resp = strdup("");
        break;

      case PAM_ERROR_MSG:
        spdlog::error("PAM Error: {}", m->msg);
        break;

      case PAM_TEXT_INFO:
        spdlog::debug("PAM Info: {}", m->msg);
        if (session && session->prompt_callback) {
          session->prompt_callback(m->msg);
        }
        break;

      default:
        break;
    }
    (*resp)[i].resp_retcode = 0;
  }

  return PAM_SUCCESS;
}

static PamResult run_pam(PamSession& session) {
  pam_handle_t* pamh = nullptr;
  struct pam_conv conv = {pam_conversation, &session};

  int ret = pam_start(session.service_name.c_str(), session.user.c_str(),
                      &conv, &pamh);
  if (ret != PAM_SUCCESS) {
    session.error = std::string("pam_start 失败: ") + pam_strerror(pamh, ret);
    spdlog::error("PAM: {}", session.error);
    return PamResult::ERROR;
  }

  pam_set_item(pamh, PAM_TTY, "/dev/console");
  pam_set_item(pamh, PAM_RHOST, "localhost");
  pam_set_item(pamh, PAM_RUSER, session.user.c_str());

  spdlog::debug("PAM: 等待验证...");
  ret = pam_authenticate(pamh, 0);

  PamResult result;
  if (ret == PAM_SUCCESS) {
    spdlog::debug("PAM: 验证成功");
    result = PamResult::SUCCESS;
  } else if (ret == PAM_AUTH_ERR) {
    session.error = "验证失败";
    result = PamResult::AUTH_FAILED;
  } else if (ret == PAM_USER_UNKNOWN) {
    session.error = "用户不存在";
    result = PamResult::AUTH_FAILED;
  } else if (ret == PAM_MAXTRIES) {
    session.error = "达到最大尝试次数";
    result = PamResult::AUTH_FAILED;
  } else if (ret == PAM_ABORT || ret == PAM_CONV_ERR) {
    session.error = "用户取消";
    result = PamResult::USER_CANCELLED;
  } else {
    session.error = std::string("PAM 错误 (") + std::to_string(ret) +
                    "): " + pam_strerror(pamh, ret);
    spdlog::error("PAM: {}", session.error);
    result = PamResult::ERROR;
  }

  pam_end(pamh, ret);
  return result;
}

PamAuthenticator::PamAuthenticator(const std::string& service_name)
    : service_name_(service_name) {}

PamResult PamAuthenticator::authenticate(const std::string& username) {
  auto session = std::make_shared<PamSession>();
  session->service_name = service_name_;
  session->user = username;
  session->prompt_callback = prompt_callback_;

  // 如果未指定用户名，获取当前用户
  if (session->user.empty()) {
    struct passwd* pw = getpwuid(getuid());
    if (pw == nullptr) {
      last_error_ = "无法获取当前用户名";
      return PamResult::ERROR;
    }
    session->user = pw->pw_name;
  }

  spdlog::debug("PAM: 开始验证用户 '{}' (服务: {})", session->user,
                service_name_);

  // 上一次超时的 PAM 会话还没返回时不再开新会话
  if (g_pam_pending.exchange(true)) {
    last_error_ = "上一次 PAM 验证仍在进行";
    spdlog::warn("PAM: {}", last_error_);
    return PamResult::USER_CANCELLED;
  }

  if (timeout_seconds_ <= 0) {
    PamResult result = run_pam(*session);
    g_pam_pending = false;
    last_error_ = session->error;
    return result;
  }

  // 设置了超时：PAM 在独立线程中运行，超时后线程继续持有 session 直到
  // PAM 返回，返回前 g_pam_pending 一直为 true
  std::packaged_task<PamResult()> task([session]() {
    PamResult result = run_pam(*session);
    g_pam_pending = false;
    return result;
  });
  std::future<PamResult> future = task.get_future();
  std::thread(std::move(task)).detach();

  if (future.wait_for(std::chrono::seconds(timeout_seconds_)) ==
      std::future_status::timeout) {
    last_error_ = "验证超时";
    spdlog::warn("PAM: 验证超时 ({} 秒)", timeout_seconds_);
    return PamResult::USER_CANCELLED;
  }

  PamResult result = future.get();
  last_error_ = session->error;
  return result;
}

// ============== PamUserPresence 实现 ==============

PamUserPresence::PamUserPresence(std::string service_name, bool use_pam,
                                 bool default_result, int timeout_seconds)
    : service_name_(std::move(service_name)),
      use_pam_(use_pam),
      default_result_(default_result),
      timeout_seconds_(timeout_seconds) {}

bool PamUserPresence::approve_make_credential(
    const std::string& display_name) {
  return verify_user("创建 FIDO2 凭证 (" + display_name + ")");
}

bool PamUserPresence::approve_get_assertion(const std::string& rp_id) {
  return verify_user("FIDO2 身份验证 (" + rp_id + ")");
}

void PamUserPresence::wink() {
  spdlog::info("========================================");
  spdlog::info("ctapauth: 收到 wink 请求");
  spdlog::info("========================================");
}

bool PamUserPresence::verify_user(const std::string& operation) {
  spdlog::info("========================================");
  spdlog::info("FIDO2 验证请求: {}", operation);
  spdlog::info("========================================");

  if (!use_pam_) {
    spdlog::info("PAM 验证已禁用，使用默认结果: {}",
                 default_result_ ? "允许" : "拒绝");
    return default_result_;
  }

  spdlog::info("启动 PAM 验证 (服务: {})...", service_name_);

  PamAuthenticator pam(service_name_);
  pam.set_timeout(timeout_seconds_);
  pam.set_prompt_callback(
      [](const std::string& msg) { spdlog::info("   {}", msg); });

  switch (pam.authenticate()) {
    case PamResult::SUCCESS:
      spdlog::info("PAM 验证成功");
      return true;
    case PamResult::AUTH_FAILED:
      spdlog::warn("PAM 验证失败: {}", pam.last_error());
      return false;
    case PamResult::USER_CANCELLED:
      spdlog::info("用户取消或超时");
      return false;
    case PamResult::ERROR:
      break;
  }

  spdlog::error("PAM 错误: {}", pam.last_error());
  throw PresenceError("PAM 错误: " + pam.last_error());
}

}  // namespace ctapauth
