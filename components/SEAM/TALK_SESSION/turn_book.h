#pragma once

#include "language_route.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

enum class TranslationStatus {
  None = 0, ///< 还没有最终文本
  Pending,  ///< 已提交翻译
  Done,
  Failed,   ///< 翻译失败，保留原文
};

/**
 * @brief 一次按住说话
 */
struct Turn {
  uint32_t id = 0;
  Side side = Side::Undetermined;
  std::string partial_text;    ///< 每次 partial 覆盖
  std::string final_text;      ///< 只写一次
  std::string translated_text; ///< 只写一次
  std::string source_lang;
  std::string target_lang;
  bool finalized = false;
  TranslationStatus translation = TranslationStatus::None;
};

/**
 * @brief 按 id 索引的发言记录，外加一个"当前发言"引用
 *
 * 自动识别模式下，按下时还不知道是哪一方，completed 事件回来后
 * 通过当前发言引用找到记录；没有可用记录时新建一条。
 *
 * 已结束的记录超过 maxTurns 时从最旧的开始淘汰。
 */
class TurnBook {
public:
  explicit TurnBook(size_t maxTurns = 32);

  /**
   * @brief 新建一条记录并设为当前发言
   */
  Turn &open(Side side);

  /**
   * @brief 当前发言，没有时返回 nullptr
   */
  Turn *active();

  Turn *find(uint32_t id);
  const Turn *find(uint32_t id) const;

  void clearActive() { m_activeId = 0; }

  /**
   * @brief 删除一条记录（被放弃的发言），若是当前发言一并清除引用
   */
  void discard(uint32_t id);

  /**
   * @brief 为 completed 事件找到要写入的记录
   *
   * 当前发言存在且未结束则返回它；否则新建一条（side 由调用方给出）。
   * 返回的记录已经是当前发言。
   */
  Turn &claimForCompletion(Side side);

  /**
   * @brief 把 partial 文本写入当前未结束的发言
   * @return false 没有可写入的发言（已结束或不存在）
   */
  bool applyPartial(const std::string &text);

  const std::map<uint32_t, Turn> &turns() const { return m_turns; }
  size_t size() const { return m_turns.size(); }

private:
  void evict();

  size_t m_maxTurns;
  std::map<uint32_t, Turn> m_turns;
  uint32_t m_activeId = 0; // 0 表示没有
  uint32_t m_nextId = 1;
};
