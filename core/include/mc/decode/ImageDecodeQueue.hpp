#pragma once
#include "mc/decode/ThreadSafeQueue.hpp"
#include "mc/element/Element.hpp"
#include "mc/ids/Id.hpp"

#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace mc {

using DecodeTicket = std::uint64_t;

// What the eventual element closes over: the viewport that asked for it.
struct DecodeRequest {
  DecodeTicket ticket{0};
  Id viewportId;
};

struct DecodeCompletion {
  DecodeTicket ticket{0};
  std::shared_ptr<const Bitmap> bitmap;  // null = decode failed
};

// Bookkeeping between "decode started" and "decode finished". complete()
// is safe from any thread; everything else runs on the UI thread.
class ImageDecodeQueue {
public:
  DecodeTicket request(const Id& viewportId);

  // Any thread.
  void complete(DecodeTicket ticket, std::shared_ptr<const Bitmap> bitmap);

  struct Ready {
    DecodeRequest request;
    std::shared_ptr<const Bitmap> bitmap;
  };

  // Completions received so far whose ticket is known. Unknown or
  // duplicate tickets are dropped.
  std::vector<Ready> takeReady();

  std::size_t pendingCount() const { return pending_.size(); }

private:
  DecodeTicket nextTicket_{1};
  std::unordered_map<DecodeTicket, DecodeRequest> pending_;
  ThreadSafeQueue<DecodeCompletion> completions_;
};

} // namespace mc
