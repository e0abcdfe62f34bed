#pragma once

#include <atomic>     // std::atomic
#include <filesystem> // std::filesystem::path

#include "../Core/Observation.hpp"
#include "Error.hpp"
#include "Types.hpp"

namespace almanac::utils::cache {
  namespace {
    using core::CacheKey;
    using core::ObservationRecord;

    using types::Mutex;
    using types::Option;
    using types::Result;
    using types::String;
    using types::u64;
    using types::u8;
    using types::Unit;
    using types::UnorderedMap;

    namespace fs = std::filesystem;
  } // namespace

  enum class CacheLocation : u8 {
    InMemory,      ///< Volatile, lost on app exit. Fastest.
    TempDirectory, ///< Persists until next reboot or system cleanup.
    Persistent     ///< Stored in a user-level cache dir (e.g., ~/.cache/almanac).
  };

  /**
   * @struct CacheEntry
   * @brief On-disk form of a cached observation.
   *
   * The canonical key text is stored alongside the record so a digest collision
   * or a misplaced file reads as a miss instead of returning the wrong day.
   */
  struct CacheEntry {
    String            key;
    ObservationRecord data;
  };

  /**
   * @brief Persistent key/value store for archive observations.
   *
   * Archive data for a past day never changes, so entries have no expiry. Reads
   * never fail: anything unreadable is a miss. Writes are best-effort and are
   * published with an atomic rename, so concurrent writers of the same key never
   * leave a torn file behind.
   */
  class CacheStore {
   public:
    /**
     * @brief Creates a store at the default directory for the given location.
     */
    explicit CacheStore(CacheLocation location = CacheLocation::Persistent);

    /**
     * @brief Creates a disk-backed store rooted at an explicit directory.
     */
    explicit CacheStore(fs::path directory);

    /**
     * @brief Default directory for a location policy.
     * @return $XDG_CACHE_HOME/almanac or ~/.cache/almanac for Persistent, a subdirectory of the
     * system temp directory for TempDirectory, None for InMemory.
     */
    static fn DefaultDirectory(CacheLocation location) -> Option<fs::path>;

    /**
     * @brief Looks up an observation.
     * @return The cached record, or None on a miss or an unreadable entry.
     */
    [[nodiscard]] fn get(const CacheKey& key) const -> Option<ObservationRecord>;

    /**
     * @brief Stores an observation. Failures are logged, never returned.
     */
    fn put(const CacheKey& key, const ObservationRecord& record) -> Unit;

    /**
     * @brief Removes every entry from memory and disk.
     */
    fn clear() -> Result<>;

    [[nodiscard]] fn directory() const -> const Option<fs::path>& {
      return m_directory;
    }

    /**
     * @brief Path of the file backing a key, or None for an in-memory store.
     */
    [[nodiscard]] fn pathFor(const CacheKey& key) const -> Option<fs::path>;

   private:
    Option<fs::path> m_directory;

    mutable Mutex                     m_memoryMutex;
    mutable UnorderedMap<u64, String> m_inMemory; ///< digest -> serialized CacheEntry
    std::atomic<u64>                  m_tempCounter = 0;

    fn writeFile(const fs::path& target, const String& buffer) -> Result<>;
  };
} // namespace almanac::utils::cache

template <>
struct glz::meta<almanac::utils::cache::CacheEntry> {
  using T = almanac::utils::cache::CacheEntry;

  static constexpr auto value = object("key", &T::key, "data", &T::data);
};
