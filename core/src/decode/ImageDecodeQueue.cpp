#include "mc/decode/ImageDecodeQueue.hpp"

namespace mc {

DecodeTicket ImageDecodeQueue::request(const Id& viewportId) {
  DecodeRequest r;
  r.ticket = nextTicket_++;
  r.viewportId = viewportId;
  pending_[r.ticket] = r;
  return r.ticket;
}

void ImageDecodeQueue::complete(DecodeTicket ticket, std::shared_ptr<const Bitmap> bitmap) {
  completions_.push(DecodeCompletion{ticket, std::move(bitmap)});
}

std::vector<ImageDecodeQueue::Ready> ImageDecodeQueue::takeReady() {
  std::vector<Ready> out;
  for (auto& c : completions_.drain()) {
    auto it = pending_.find(c.ticket);
    if (it == pending_.end()) continue;
    out.push_back(Ready{it->second, std::move(c.bitmap)});
    pending_.erase(it);
  }
  return out;
}

} // namespace mc
