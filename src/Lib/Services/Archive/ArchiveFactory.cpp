#include <Almanac/Services/Archive.hpp>

#include <utility> // std::unreachable

#include "NasaPowerClient.hpp"

namespace almanac::services::archive {
  fn CreateArchiveClient(const Provider provider, const ArchiveOptions& options) -> SharedPointer<IArchiveClient> {
    using enum Provider;

    switch (provider) {
      case NasaPower:
        return std::make_shared<NasaPowerClient>(options);
      case Climatology:
        return nullptr;
      default:
        std::unreachable();
    }
  }
} // namespace almanac::services::archive
