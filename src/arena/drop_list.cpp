#include "arena/drop_list.hpp"

namespace blink::arena {

void drop_list::reset() noexcept {
  drops* next = std::exchange(root_, nullptr);
  while (next != nullptr) {
    drops* record = next;
    next = record->next_;
    record->drop_(record, record->count_);
  }
}

}  // namespace blink::arena
