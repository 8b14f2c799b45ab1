#include "key_size.hpp"
#include "asn1.hpp"
#include "logger_utils.hpp"
#include "tree_walker.hpp"
#include <cstdint>
#include <optional>

namespace asnsig::asn {

namespace {

class LastElementTracker : public IElementVisitor {
 public:
  void OnElement(const AsnElement &element) override { last_ = element; }

  [[nodiscard]] const std::optional<AsnElement> &Last() const noexcept {
    return last_;
  }

 private:
  std::optional<AsnElement> last_;
};

} // namespace

uint64_t EstimateKeySize(BytesView data) {
  LastElementTracker tracker;
  const WalkStatus status = WalkTree(data, 0, tracker);
  if (!status.Ok()) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->debug("[EstimateKeySize] the structure is decoded partially");
    }
  }
  const auto &last = tracker.Last();
  if (!last || !last->Is(AsnTag::kOctetString)) {
    return 0;
  }
  return last->ContentLength() * 8;
}

} // namespace asnsig::asn
