#ifndef FEEDSTORE_BYTE_STREAM_HPP
#define FEEDSTORE_BYTE_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace feedstore::repository {

using Bytes = std::vector<std::uint8_t>;

// Lazy forward-only sequence of byte chunks
class ByteIterator {
public:
  virtual ~ByteIterator() = default;

  // Replaces chunk with the next run of bytes, returns false once exhausted
  virtual bool next(Bytes& chunk) = 0;
};

using ByteIteratorPtr = std::unique_ptr<ByteIterator>;

// Write-side source: called until it returns false, may throw to abort the write
using ChunkProducer = std::function<bool(Bytes&)>;


// Yields a single in-memory buffer as one chunk
class MemoryByteIterator : public ByteIterator {
public:
  explicit MemoryByteIterator(Bytes content);

  bool next(Bytes& chunk) override;

private:
  Bytes content_;
  bool consumed_;
};


// ---- HELPERS ----
// Concatenates every remaining chunk
Bytes read_all(ByteIterator& iterator);
// Producer over a fixed list of chunks
ChunkProducer produce_from(std::vector<Bytes> chunks);
// Producer pulling from an iterator, which must outlive the producer
ChunkProducer produce_from(ByteIterator& source);

Bytes to_bytes(const std::string& text);
std::string to_string(const Bytes& bytes);

} // namespace feedstore::repository

#endif // FEEDSTORE_BYTE_STREAM_HPP
