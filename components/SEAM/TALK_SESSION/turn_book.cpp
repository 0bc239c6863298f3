#include "turn_book.h"

#include "esp_log.h"

static const char *TAG = "TurnBook";

TurnBook::TurnBook(size_t maxTurns) : m_maxTurns(maxTurns ? maxTurns : 1) {}

Turn &TurnBook::open(Side side) {
  uint32_t id = m_nextId++;
  if (m_nextId == 0) {
    m_nextId = 1;
  }

  Turn &turn = m_turns[id];
  turn.id = id;
  turn.side = side;
  m_activeId = id;

  ESP_LOGD(TAG, "Open turn #%lu (%s)", (unsigned long)id, GetSideName(side));
  evict();
  return m_turns[id];
}

Turn *TurnBook::active() { return m_activeId ? find(m_activeId) : nullptr; }

Turn *TurnBook::find(uint32_t id) {
  auto it = m_turns.find(id);
  return it == m_turns.end() ? nullptr : &it->second;
}

const Turn *TurnBook::find(uint32_t id) const {
  auto it = m_turns.find(id);
  return it == m_turns.end() ? nullptr : &it->second;
}

void TurnBook::discard(uint32_t id) {
  if (m_activeId == id) {
    m_activeId = 0;
  }
  m_turns.erase(id);
}

Turn &TurnBook::claimForCompletion(Side side) {
  Turn *turn = active();
  if (turn != nullptr && !turn->finalized) {
    return *turn;
  }
  ESP_LOGI(TAG, "No open turn for completed transcript, synthesizing one");
  return open(side);
}

bool TurnBook::applyPartial(const std::string &text) {
  Turn *turn = active();
  if (turn == nullptr || turn->finalized) {
    return false;
  }
  turn->partial_text = text;
  return true;
}

void TurnBook::evict() {
  // std::map 按 id 升序，最前面就是最旧的
  auto it = m_turns.begin();
  while (m_turns.size() > m_maxTurns && it != m_turns.end()) {
    if (it->first != m_activeId && it->second.finalized) {
      it = m_turns.erase(it);
    } else {
      ++it;
    }
  }
}
