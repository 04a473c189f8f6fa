#include "repository/byte_stream.hpp"

namespace feedstore::repository {

//==============================================
// MEMORY BYTE ITERATOR
//==============================================

MemoryByteIterator::MemoryByteIterator(Bytes content)
  : content_(std::move(content))
  , consumed_(false) {}

bool MemoryByteIterator::next(Bytes& chunk) {
  // An empty buffer is an empty sequence, not one empty chunk
  if (consumed_ || content_.empty()) {
    consumed_ = true;
    return false;
  }
  consumed_ = true;
  chunk = std::move(content_);
  content_.clear();
  return true;
}


//==============================================
// HELPERS
//==============================================

Bytes read_all(ByteIterator& iterator) {
  Bytes result;
  Bytes chunk;
  while (iterator.next(chunk)) {
    result.insert(result.end(), chunk.begin(), chunk.end());
  }
  return result;
}

ChunkProducer produce_from(std::vector<Bytes> chunks) {
  std::size_t index = 0;
  return [chunks = std::move(chunks), index](Bytes& chunk) mutable {
    if (index >= chunks.size()) {
      return false;
    }
    chunk = chunks[index++];
    return true;
  };
}

ChunkProducer produce_from(ByteIterator& source) {
  return [&source](Bytes& chunk) { return source.next(chunk); };
}

Bytes to_bytes(const std::string& text) {
  return Bytes(text.begin(), text.end());
}

std::string to_string(const Bytes& bytes) {
  return std::string(bytes.begin(), bytes.end());
}

} // namespace feedstore::repository
