#pragma once

#include <chrono> // std::chrono::{milliseconds, seconds}

#include "../Core/Calendar.hpp"
#include "../Core/Observation.hpp"
#include "../Utils/CacheStore.hpp"
#include "../Utils/Types.hpp"
#include "../Utils/WorkerPool.hpp"
#include "Archive.hpp"

namespace almanac::services::fetch {
  namespace {
    using archive::IArchiveClient;

    using core::CalendarDate;
    using core::Coords;
    using core::Sample;
    using core::SampleEntry;

    using utils::cache::CacheStore;
    using utils::concurrency::WorkerPool;

    using utils::types::i32;
    using utils::types::Result;
    using utils::types::SharedPointer;
    using utils::types::String;
  } // namespace

  struct FetcherOptions {
    std::chrono::milliseconds deadline  = std::chrono::seconds(60); ///< Wall-clock bound for one fetch().
    bool                      readCache = true;                     ///< When false, lookups are skipped but archive results are still stored.
  };

  /**
   * @brief Resolves a single year: cache, then archive, then climatology.
   *
   * Never fails. Archive errors and exceptions thrown by the archive become a
   * climatology entry carrying the message as its fallback reason. Cache hits are clamped. Only archive results are written to the cache.
   */
  class YearFetchTask {
   public:
    YearFetchTask(
      const Coords&                       coords,
      const CalendarDate&                 date,
      SharedPointer<const IArchiveClient> archive,
      SharedPointer<CacheStore>           cache,
      bool                                readCache = true
    );

    [[nodiscard]] fn run() const -> SampleEntry;

    [[nodiscard]] fn date() const -> const CalendarDate& {
      return m_date;
    }

    /**
     * @brief Climatology entry for a coordinate and day, tagged with why it was needed.
     */
    static fn Fallback(const Coords& coords, const CalendarDate& date, String reason) -> SampleEntry;

   private:
    Coords                              m_coords;
    CalendarDate                        m_date;
    SharedPointer<const IArchiveClient> m_archive;
    SharedPointer<CacheStore>           m_cache;
    bool                                m_readCache;
  };

  /**
   * @brief Fans a multi-year request out over a pool of ALMANAC_MAX_CONCURRENT_FETCHES workers.
   *
   * The pool lives as long as the fetcher and is shared by every fetch() call.
   * Destroying the fetcher waits for archive calls that are already in flight.
   */
  class HistoricalFetcher {
   public:
    /**
     * @param archive Remote archive, or nullptr to resolve every cache miss with the estimator.
     * @param cache Shared cache store, or nullptr to run without one.
     * @param options Deadline and cache behaviour.
     */
    HistoricalFetcher(SharedPointer<const IArchiveClient> archive, SharedPointer<CacheStore> cache, FetcherOptions options = {});

    /**
     * @brief Resolves the given day for each of the `yearsBack` years before the current one.
     *
     * Years still unresolved when the deadline passes are abandoned and filled in
     * with climatology estimates, so a successful result always has exactly
     * `yearsBack` entries in ascending year order.
     *
     * @return InvalidArgument for an out-of-range coordinate, month/day or a `yearsBack`
     * outside [1, ALMANAC_MAX_YEARS_BACK]. InsufficientData if nothing could be resolved.
     */
    fn fetch(const Coords& coords, i32 month, i32 day, i32 yearsBack) -> Result<Sample>;

    [[nodiscard]] fn options() const -> const FetcherOptions& {
      return m_options;
    }

   private:
    SharedPointer<const IArchiveClient> m_archive;
    SharedPointer<CacheStore>           m_cache;
    FetcherOptions                      m_options;
    WorkerPool                          m_pool;
  };
} // namespace almanac::services::fetch
