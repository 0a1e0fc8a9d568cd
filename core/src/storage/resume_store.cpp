#include "mbt/storage/resume_store.h"

namespace mbt::storage {

uint32_t ResumeToken::chunk_count() const {
  if (file_size == 0 || chunk_size == 0) return 1;
  return static_cast<uint32_t>((file_size + chunk_size - 1) / chunk_size);
}

} // namespace mbt::storage
