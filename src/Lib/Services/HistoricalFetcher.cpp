#include <Almanac/Services/HistoricalFetcher.hpp>

#include <atomic>             // std::atomic
#include <condition_variable> // std::condition_variable
#include <mutex>              // std::unique_lock

#include <Almanac/Services/Climatology.hpp>
#include <Almanac/Utils/Definitions.hpp>
#include <Almanac/Utils/Error.hpp>
#include <Almanac/Utils/Logging.hpp>
#include <Almanac/Utils/Types.hpp>

using namespace almanac::utils::types;
using almanac::core::CacheKey;
using almanac::core::CalendarDate;
using almanac::core::Coords;
using almanac::core::ObservationRecord;
using almanac::core::RecordOrigin;
using almanac::core::Sample;
using almanac::core::SampleEntry;
using almanac::services::archive::IArchiveClient;
using almanac::services::fetch::FetcherOptions;
using almanac::services::fetch::HistoricalFetcher;
using almanac::services::fetch::YearFetchTask;
using almanac::utils::cache::CacheStore;
using almanac::utils::error::AlmanacError;
using enum almanac::utils::error::AlmanacErrorCode;

namespace {
  constexpr PCStr DEADLINE_REASON   = "deadline exceeded";
  constexpr PCStr NO_ARCHIVE_REASON = "no archive configured";

  /**
   * @brief Per-call state shared between the caller and the jobs it queued.
   *
   * Jobs hold their own reference, so a job that finishes after the caller gave
   * up still writes into live memory.
   */
  struct FetchState {
    Mutex                    mutex;
    std::condition_variable  done;
    Vec<Option<SampleEntry>> slots;
    usize                    remaining = 0;
    std::atomic<bool>        abandoned = false;
  };
} // namespace

YearFetchTask::YearFetchTask(
  const Coords&                       coords,
  const CalendarDate&                 date,
  SharedPointer<const IArchiveClient> archive,
  SharedPointer<CacheStore>           cache,
  const bool                          readCache
)
  : m_coords(coords), m_date(date), m_archive(std::move(archive)), m_cache(std::move(cache)), m_readCache(readCache) {}

fn YearFetchTask::Fallback(const Coords& coords, const CalendarDate& date, String reason) -> SampleEntry {
  ObservationRecord record = almanac::services::climatology::EstimateFor(coords, date);
  record.year              = date.year;

  return { .record = record, .origin = RecordOrigin::Climatology, .fallbackReason = std::move(reason) };
}

fn YearFetchTask::run() const -> SampleEntry {
  const CacheKey key = CacheKey::For(m_coords, m_date);

  if (m_cache && m_readCache)
    if (Option<ObservationRecord> cached = m_cache->get(key)) {
      debug_log("Cache hit for {} ({})", m_date.toIso(), key.hex());
      return { .record = cached->clamped(), .origin = RecordOrigin::Cache, .fallbackReason = None };
    }

  if (!m_archive)
    return Fallback(m_coords, m_date, NO_ARCHIVE_REASON);

  Result<ObservationRecord> fetched;

  try {
    fetched = m_archive->fetchDay(m_coords, m_date);
  } catch (const Exception& e) {
    warn_log("Archive threw for {}, using climatology: {}", m_date.toIso(), e.what());
    return Fallback(m_coords, m_date, e.what());
  }

  if (!fetched) {
    warn_log("Using climatology for {}: {}", m_date.toIso(), fetched.error().message);
    return Fallback(m_coords, m_date, fetched.error().message);
  }

  ObservationRecord record = fetched->clamped();
  record.year              = m_date.year;

  if (m_cache)
    m_cache->put(key, record);

  return { .record = record, .origin = RecordOrigin::Archive, .fallbackReason = None };
}

HistoricalFetcher::HistoricalFetcher(SharedPointer<const IArchiveClient> archive, SharedPointer<CacheStore> cache, FetcherOptions options)
  : m_archive(std::move(archive)), m_cache(std::move(cache)), m_options(options), m_pool(ALMANAC_MAX_CONCURRENT_FETCHES) {}

fn HistoricalFetcher::fetch(const Coords& coords, const i32 month, const i32 day, const i32 yearsBack) -> Result<Sample> {
  using almanac::core::CurrentYear;
  using almanac::core::ResolveInYear;

  if (Result<> valid = almanac::core::ValidateCoords(coords); !valid)
    return Err(valid.error());

  if (Result<> valid = almanac::core::ValidateMonthDay(month, day); !valid)
    return Err(valid.error());

  if (yearsBack <= 0 || yearsBack > ALMANAC_MAX_YEARS_BACK)
    ERR_FMT(InvalidArgument, "years_back must be between 1 and {}, got {}", ALMANAC_MAX_YEARS_BACK, yearsBack);

  const i32   firstYear = CurrentYear() - yearsBack;
  const usize count     = static_cast<usize>(yearsBack);

  Vec<CalendarDate> dates;
  dates.reserve(count);

  for (i32 offset = 0; offset < yearsBack; ++offset)
    dates.push_back(ResolveInYear(firstYear + offset, month, day));

  const auto deadline = std::chrono::steady_clock::now() + m_options.deadline;

  auto state = std::make_shared<FetchState>();
  state->slots.resize(count);
  state->remaining = count;

  debug_log("Fetching {} years for ({}, {}) on {:02}-{:02}", yearsBack, coords.lat, coords.lon, month, day);

  for (usize index = 0; index < count; ++index) {
    YearFetchTask task(coords, dates[index], m_archive, m_cache, m_options.readCache);

    Result<> submitted = m_pool.submit([state, task = std::move(task), index]() -> Unit {
      if (state->abandoned.load())
        return;

      SampleEntry entry = task.run();

      {
        const LockGuard lock(state->mutex);
        state->slots[index] = std::move(entry);
        --state->remaining;
      }

      state->done.notify_all();
    });

    if (!submitted) {
      warn_at(submitted.error());

      const LockGuard lock(state->mutex);
      state->slots[index] = YearFetchTask::Fallback(coords, dates[index], submitted.error().message);
      --state->remaining;
    }
  }

  Vec<Option<SampleEntry>> slots;

  {
    std::unique_lock lock(state->mutex);

    if (!state->done.wait_until(lock, deadline, [&state] { return state->remaining == 0; })) {
      state->abandoned.store(true);
      warn_log("Fetch deadline of {}ms passed with {} of {} years unresolved", m_options.deadline.count(), state->remaining, count);
    }

    slots = state->slots;
  }

  Sample sample;
  sample.reserve(count);

  for (usize index = 0; index < count; ++index) {
    if (slots[index])
      sample.push_back(std::move(*slots[index]));
    else
      sample.push_back(YearFetchTask::Fallback(coords, dates[index], DEADLINE_REASON));
  }

  if (sample.empty())
    ERR(InsufficientData, "No observations could be resolved for the request");

  return sample;
}
