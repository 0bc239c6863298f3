#pragma once

#include "esp_err.h"
#include "esp_websocket_client.h"
#include "session_protocol.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

/**
 * @brief 中继连接配置
 */
struct RelayLinkConfig {
    std::string url;                 ///< ws://<relay>/api/v1/asr/realtime
    int buffer_size = 4096;          ///< 接收缓冲区大小
    int network_timeout_ms = 10000;
    int send_timeout_ms = 1000;
};

/**
 * @brief 到中继的 WebSocket 连接
 *
 * 每轮发言 open() 一次、close() 一次，每次 open() 新建一个
 * esp_websocket_client，并分配一个递增的 generation。所有回调都带上
 * generation，上层据此丢弃已关闭连接的迟到事件。
 *
 * 回调在 websocket 任务里执行，只能投递，不能阻塞。
 *
 * @example
 *   auto& link = RelayLink::instance();
 *   link.init({.url = "ws://192.168.1.10:8080/api/v1/asr/realtime"});
 *   link.setOnEvent([](uint32_t gen, RecognitionEvent&& ev) { ... });
 *   link.open();
 */
class RelayLink {
public:
    static RelayLink& instance();

    RelayLink(const RelayLink&) = delete;
    RelayLink& operator=(const RelayLink&) = delete;

    esp_err_t init(const RelayLinkConfig& config);

    /**
     * @brief 发起连接（不等待握手）
     */
    esp_err_t open();

    /**
     * @brief 关闭并销毁当前连接，之后不会再有该连接的回调
     */
    void close();

    bool isOpen() const { return connected_.load(); }

    esp_err_t sendText(const std::string& text);

    /// 当前连接的 generation，没有连接时为 0
    uint32_t generation() const { return generation_.load(); }

    using LinkCallback = std::function<void(uint32_t generation)>;
    using EventCallback = std::function<void(uint32_t generation, RecognitionEvent&& event)>;

    void setOnOpened(LinkCallback cb) { on_opened_ = cb; }
    void setOnClosed(LinkCallback cb) { on_closed_ = cb; }
    void setOnEvent(EventCallback cb) { on_event_ = cb; }

private:
    RelayLink() = default;
    ~RelayLink();

    // 每个 client 一个，随 client 一起销毁
    struct LinkContext {
        RelayLink* self = nullptr;
        uint32_t generation = 0;
        bool closed_posted = false;
        bool rx_in_text = false;
        std::string rx_text_buf;

        /// 累积一个 DATA 事件，拼出完整文本消息时返回 true
        bool collect(const esp_websocket_event_data_t* data);
    };

    RelayLinkConfig config_;
    bool initialized_ = false;
    std::mutex mutex_;

    esp_websocket_client_handle_t client_ = nullptr;
    LinkContext* ctx_ = nullptr;
    std::atomic<bool> connected_{false};
    std::atomic<uint32_t> generation_{0};
    uint32_t next_generation_ = 1;

    LinkCallback on_opened_;
    LinkCallback on_closed_;
    EventCallback on_event_;

    static void eventHandler(void* arg, esp_event_base_t event_base,
                             int32_t event_id, void* event_data);
    void handleEvent(LinkContext* ctx, esp_websocket_event_data_t* data, int32_t event_id);
    void handleTextMessage(LinkContext* ctx, const char* data, size_t len);
    void postClosed(LinkContext* ctx);
};
