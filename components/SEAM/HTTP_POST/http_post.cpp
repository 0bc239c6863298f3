#include "http_post.h"

#include "esp_http_client.h"
#include "esp_log.h"

#include <cstdlib>
#include <cstring>

static const char *TAG = "HttpPost";

namespace {
// HTTP_EVENT_ON_DATA 的累积上下文
struct Sink {
  HttpBody *out;
  size_t capacity;
  size_t limit;
  bool overflow;
};

bool grow(Sink &sink, size_t need) {
  if (need > sink.limit) {
    return false;
  }
  size_t cap = sink.capacity ? sink.capacity : 4096;
  while (cap < need) {
    cap *= 2;
  }
  if (cap > sink.limit) {
    cap = sink.limit;
  }
  auto *p = static_cast<uint8_t *>(realloc(sink.out->data, cap));
  if (p == nullptr) {
    return false;
  }
  sink.out->data = p;
  sink.capacity = cap;
  return true;
}

esp_err_t onHttpEvent(esp_http_client_event_t *evt) {
  auto *sink = static_cast<Sink *>(evt->user_data);
  if (evt->event_id != HTTP_EVENT_ON_DATA || sink->overflow) {
    return ESP_OK;
  }
  size_t need = sink->out->size + (size_t)evt->data_len;
  if (need > sink->capacity && !grow(*sink, need)) {
    sink->overflow = true;
    return ESP_OK;
  }
  memcpy(sink->out->data + sink->out->size, evt->data, evt->data_len);
  sink->out->size = need;
  return ESP_OK;
}
} // namespace

HttpBody::~HttpBody() { free(data); }

uint8_t *HttpBody::release() {
  uint8_t *p = data;
  data = nullptr;
  size = 0;
  return p;
}

esp_err_t HttpPost(const std::string &url, const std::string &body,
                   const HttpPostOptions &opts, HttpBody &out) {
  if (url.empty()) {
    return ESP_ERR_INVALID_ARG;
  }

  Sink sink = {&out, 0, opts.max_response_bytes, false};

  esp_http_client_config_t cfg = {};
  cfg.url = url.c_str();
  cfg.method = HTTP_METHOD_POST;
  cfg.timeout_ms = opts.timeout_ms;
  cfg.event_handler = onHttpEvent;
  cfg.user_data = &sink;

  esp_http_client_handle_t client = esp_http_client_init(&cfg);
  if (client == nullptr) {
    return ESP_ERR_NO_MEM;
  }
  esp_http_client_set_header(client, "Content-Type", opts.content_type);
  esp_http_client_set_header(client, "Accept", opts.accept);
  esp_http_client_set_post_field(client, body.data(), (int)body.size());

  esp_err_t err = esp_http_client_perform(client);
  out.status = esp_http_client_get_status_code(client);
  int64_t declared = esp_http_client_get_content_length(client);
  esp_http_client_cleanup(client);

  if (err != ESP_OK) {
    ESP_LOGE(TAG, "POST %s failed: %s", url.c_str(), esp_err_to_name(err));
    return err;
  }
  if (sink.overflow) {
    ESP_LOGE(TAG, "response exceeds %u bytes", (unsigned)opts.max_response_bytes);
    return ESP_ERR_NO_MEM;
  }
  if (declared > 0 && (int64_t)out.size < declared) {
    ESP_LOGE(TAG, "short body: %u of %lld bytes", (unsigned)out.size,
             (long long)declared);
    return ESP_FAIL;
  }
  return ESP_OK;
}
