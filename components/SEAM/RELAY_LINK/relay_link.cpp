#include "relay_link.h"
#include "esp_log.h"

static const char* TAG = "RelayLink";

RelayLink& RelayLink::instance() {
    static RelayLink instance;
    return instance;
}

RelayLink::~RelayLink() {
    close();
}

esp_err_t RelayLink::init(const RelayLinkConfig& config) {
    if (initialized_) {
        ESP_LOGW(TAG, "Already initialized");
        return ESP_OK;
    }
    if (config.url.empty()) {
        ESP_LOGE(TAG, "Empty relay URL");
        return ESP_ERR_INVALID_ARG;
    }

    config_ = config;
    initialized_ = true;
    ESP_LOGI(TAG, "Relay URL: %s", config_.url.c_str());
    return ESP_OK;
}

esp_err_t RelayLink::open() {
    if (!initialized_) {
        ESP_LOGE(TAG, "Not initialized");
        return ESP_ERR_INVALID_STATE;
    }

    // 上一轮没关干净
    close();

    std::lock_guard<std::mutex> lock(mutex_);

    esp_websocket_client_config_t ws_config = {};
    ws_config.uri = config_.url.c_str();
    ws_config.buffer_size = config_.buffer_size;
    ws_config.network_timeout_ms = config_.network_timeout_ms;
    ws_config.disable_auto_reconnect = true;

    client_ = esp_websocket_client_init(&ws_config);
    if (!client_) {
        ESP_LOGE(TAG, "Failed to init WebSocket client");
        return ESP_FAIL;
    }

    ctx_ = new LinkContext();
    ctx_->self = this;
    ctx_->generation = next_generation_++;
    if (next_generation_ == 0) {
        next_generation_ = 1;
    }

    esp_websocket_register_events(client_, WEBSOCKET_EVENT_ANY, eventHandler, ctx_);

    generation_.store(ctx_->generation);
    esp_err_t err = esp_websocket_client_start(client_);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start WebSocket client: %s", esp_err_to_name(err));
        esp_websocket_client_destroy(client_);
        client_ = nullptr;
        delete ctx_;
        ctx_ = nullptr;
        generation_.store(0);
        return err;
    }

    ESP_LOGI(TAG, "Connecting (gen %lu)...", (unsigned long)generation_.load());
    return ESP_OK;
}

void RelayLink::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!client_) {
        return;
    }

    ESP_LOGI(TAG, "Closing (gen %lu)", (unsigned long)generation_.load());
    generation_.store(0);
    connected_.store(false);

    // destroy 会停止 client 任务，之后不会再进 eventHandler
    esp_websocket_client_destroy(client_);
    client_ = nullptr;
    delete ctx_;
    ctx_ = nullptr;
}

esp_err_t RelayLink::sendText(const std::string& text) {
    if (!connected_.load()) {
        ESP_LOGW(TAG, "Not connected");
        return ESP_ERR_INVALID_STATE;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!client_) {
        return ESP_ERR_INVALID_STATE;
    }
    int sent = esp_websocket_client_send_text(client_, text.c_str(), (int)text.length(),
                                              pdMS_TO_TICKS(config_.send_timeout_ms));
    if (sent < 0) {
        ESP_LOGE(TAG, "Failed to send text");
        return ESP_FAIL;
    }
    return ESP_OK;
}

void RelayLink::eventHandler(void* arg, esp_event_base_t event_base,
                             int32_t event_id, void* event_data) {
    auto* ctx = static_cast<LinkContext*>(arg);
    auto* data = static_cast<esp_websocket_event_data_t*>(event_data);
    ctx->self->handleEvent(ctx, data, event_id);
}

bool RelayLink::LinkContext::collect(const esp_websocket_event_data_t* data) {
    if (data->data_ptr == nullptr || data->data_len <= 0) {
        return false;
    }

    // 0x0 续帧沿用首帧类型；只拼文本，二进制整条丢弃
    if (data->op_code == 0x01 || data->op_code == 0x02) {
        rx_in_text = (data->op_code == 0x01);
        if (data->payload_offset == 0) {
            rx_text_buf.clear();
        }
    } else if (data->op_code != 0x00) {
        return false;
    }
    if (!rx_in_text) {
        return false;
    }

    rx_text_buf.append(data->data_ptr, (size_t)data->data_len);

    // 大帧会被拆成多次 DATA，payload_len 是整帧长度
    size_t received = (size_t)data->payload_offset + (size_t)data->data_len;
    bool frameComplete = data->payload_len <= 0 || received >= (size_t)data->payload_len;
    if (!data->fin || !frameComplete) {
        return false;
    }
    rx_in_text = false;
    return !rx_text_buf.empty();
}

void RelayLink::postClosed(LinkContext* ctx) {
    if (ctx->closed_posted) {
        return;
    }
    ctx->closed_posted = true;
    if (generation_.load() == ctx->generation) {
        connected_.store(false);
    }
    ctx->rx_in_text = false;
    ctx->rx_text_buf.clear();
    if (on_closed_) {
        on_closed_(ctx->generation);
    }
}

void RelayLink::handleEvent(LinkContext* ctx, esp_websocket_event_data_t* data, int32_t event_id) {
    switch (event_id) {
        case WEBSOCKET_EVENT_CONNECTED:
            ESP_LOGI(TAG, "Relay connected (gen %lu)", (unsigned long)ctx->generation);
            if (generation_.load() == ctx->generation) {
                connected_.store(true);
            }
            if (on_opened_) {
                on_opened_(ctx->generation);
            }
            break;

        case WEBSOCKET_EVENT_DISCONNECTED:
            ESP_LOGI(TAG, "Relay disconnected");
            postClosed(ctx);
            break;

        case WEBSOCKET_EVENT_CLOSED:
            ESP_LOGI(TAG, "Relay closed");
            postClosed(ctx);
            break;

        case WEBSOCKET_EVENT_ERROR:
            // ERROR 之后不一定有 DISCONNECTED
            ESP_LOGE(TAG, "Relay socket error");
            postClosed(ctx);
            break;

        case WEBSOCKET_EVENT_DATA:
            if (ctx->collect(data)) {
                handleTextMessage(ctx, ctx->rx_text_buf.c_str(), ctx->rx_text_buf.size());
                ctx->rx_text_buf.clear();
            }
            break;

        default:
            break;
    }
}

void RelayLink::handleTextMessage(LinkContext* ctx, const char* data, size_t len) {
    RecognitionEvent event;
    if (ParseRecognitionEvent(data, len, event) != ESP_OK) {
        ESP_LOGW(TAG, "Unparseable relay message (%u bytes)", (unsigned)len);
        return;
    }
    ESP_LOGD(TAG, "Event: %s", event.type_name.c_str());
    if (on_event_) {
        on_event_(ctx->generation, std::move(event));
    }
}
