#pragma once

#include "esp_err.h"
#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @brief HTTP 响应体，data 由 malloc 分配
 *
 * 调用方要么 release() 接管内存，要么交给析构释放。
 */
struct HttpBody {
  int status = 0;
  uint8_t *data = nullptr;
  size_t size = 0;

  HttpBody() = default;
  ~HttpBody();
  HttpBody(const HttpBody &) = delete;
  HttpBody &operator=(const HttpBody &) = delete;

  uint8_t *release();
};

struct HttpPostOptions {
  const char *content_type = "application/json";
  const char *accept = "application/json";
  int timeout_ms = 15000;
  size_t max_response_bytes = 64 * 1024;
};

/**
 * @brief 阻塞式 POST，读完整个响应体
 *
 * @return ESP_OK 收到响应（不论状态码，见 out.status）；传输失败返回对应错误码
 */
esp_err_t HttpPost(const std::string &url, const std::string &body,
                   const HttpPostOptions &opts, HttpBody &out);
