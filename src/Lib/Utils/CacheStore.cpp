#include <Almanac/Utils/CacheStore.hpp>

#include <fstream>      // std::{ifstream, ofstream}
#include <glaze/glaze.hpp>
#include <iterator>     // std::istreambuf_iterator
#include <system_error> // std::error_code
#include <thread>       // std::this_thread::get_id

#include <Almanac/Utils/Env.hpp>
#include <Almanac/Utils/Error.hpp>
#include <Almanac/Utils/Logging.hpp>
#include <Almanac/Utils/Types.hpp>

using namespace almanac::utils::types;
using almanac::core::CacheKey;
using almanac::core::ObservationRecord;
using almanac::utils::cache::CacheEntry;
using almanac::utils::cache::CacheLocation;
using almanac::utils::cache::CacheStore;
using almanac::utils::error::AlmanacError;
using enum almanac::utils::error::AlmanacErrorCode;

namespace fs = std::filesystem;

namespace {
  constexpr PCStr ENTRY_EXTENSION = ".beve";

  fn DecodeEntry(const String& buffer, const CacheKey& key) -> Result<ObservationRecord> {
    CacheEntry entry;

    if (const glz::error_ctx errc = glz::read_beve(entry, buffer); errc)
      ERR_FMT(CorruptedData, "Failed to decode cache entry {}: {}", key.hex(), glz::format_error(errc, buffer));

    if (entry.key != key.canonical)
      ERR_FMT(CorruptedData, "Cache entry {} belongs to '{}', expected '{}'", key.hex(), entry.key, key.canonical);

    return entry.data;
  }
} // namespace

CacheStore::CacheStore(const CacheLocation location)
  : m_directory(DefaultDirectory(location)) {}

CacheStore::CacheStore(fs::path directory)
  : m_directory(std::move(directory)) {}

fn CacheStore::DefaultDirectory(const CacheLocation location) -> Option<fs::path> {
  using almanac::utils::env::GetEnv;

  switch (location) {
    case CacheLocation::InMemory:
      return None;
    case CacheLocation::TempDirectory: {
      std::error_code errc;
      fs::path        tempDir = fs::temp_directory_path(errc);

      return errc ? fs::path(".") / "almanac-cache" : tempDir / "almanac";
    }
    case CacheLocation::Persistent:
#ifdef __APPLE__
      return fs::path(GetEnv("HOME").value_or(".")) / "Library" / "Caches" / "almanac";
#else
      if (Result<String> xdgCache = GetEnv("XDG_CACHE_HOME"))
        return fs::path(*xdgCache) / "almanac";

      return fs::path(GetEnv("HOME").value_or(".")) / ".cache" / "almanac";
#endif
  }

  return None;
}

fn CacheStore::pathFor(const CacheKey& key) const -> Option<fs::path> {
  if (!m_directory)
    return None;

  return *m_directory / (key.hex() + ENTRY_EXTENSION);
}

fn CacheStore::get(const CacheKey& key) const -> Option<ObservationRecord> {
  {
    const LockGuard lock(m_memoryMutex);

    if (auto iter = m_inMemory.find(key.digest); iter != m_inMemory.end()) {
      if (Result<ObservationRecord> record = DecodeEntry(iter->second, key))
        return *record;

      m_inMemory.erase(iter);
    }
  }

  const Option<fs::path> filePath = pathFor(key);

  if (!filePath)
    return None;

  std::error_code existsErrc;

  if (!fs::exists(*filePath, existsErrc) || existsErrc)
    return None;

  std::ifstream ifs(*filePath, std::ios::binary);

  if (!ifs) {
    debug_log("Cache entry {} exists but could not be opened, treating as a miss", filePath->string());
    return None;
  }

  String fileContents((std::istreambuf_iterator<char>(ifs)), {});

  Result<ObservationRecord> record = DecodeEntry(fileContents, key);

  if (!record) {
    warn_at(record.error());
    return None;
  }

  const LockGuard lock(m_memoryMutex);
  m_inMemory[key.digest] = std::move(fileContents);

  return *record;
}

fn CacheStore::put(const CacheKey& key, const ObservationRecord& record) -> Unit {
  const CacheEntry entry { .key = key.canonical, .data = record };

  String buffer;

  if (const glz::error_ctx errc = glz::write_beve(entry, buffer); errc) {
    warn_log("Failed to encode cache entry {}: {}", key.hex(), glz::format_error(errc, buffer));
    return;
  }

  {
    const LockGuard lock(m_memoryMutex);
    m_inMemory[key.digest] = buffer;
  }

  if (const Option<fs::path> filePath = pathFor(key))
    if (Result<> written = writeFile(*filePath, buffer); !written)
      warn_at(written.error());
}

fn CacheStore::writeFile(const fs::path& target, const String& buffer) -> Result<> {
  std::error_code errc;

  fs::create_directories(target.parent_path(), errc);

  if (errc)
    return Err(AlmanacError(std::format("Failed to create cache directory {}", target.parent_path().string()), errc));

  // Unique per writer so concurrent puts of one key never share a temp file.
  const fs::path tempPath = target.parent_path() /
    std::format("{}.{:x}.{}.tmp", target.filename().string(), std::hash<std::thread::id> {}(std::this_thread::get_id()), m_tempCounter.fetch_add(1));

  {
    std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);

    if (!ofs)
      ERR_FMT(IoError, "Failed to open {} for writing", tempPath.string());

    ofs.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));

    if (!ofs) {
      ofs.close();
      fs::remove(tempPath, errc);
      ERR_FMT(IoError, "Failed to write cache entry {}", tempPath.string());
    }
  }

  fs::rename(tempPath, target, errc);

  if (errc) {
    const AlmanacError renameError(std::format("Failed to publish cache entry {}", target.string()), errc);

    std::error_code removeErrc;
    fs::remove(tempPath, removeErrc);

    return Err(renameError);
  }

  return {};
}

fn CacheStore::clear() -> Result<> {
  {
    const LockGuard lock(m_memoryMutex);
    m_inMemory.clear();
  }

  if (!m_directory)
    return {};

  std::error_code errc;

  if (!fs::exists(*m_directory, errc))
    return {};

  for (fs::directory_iterator iter(*m_directory, errc), end; !errc && iter != end; iter.increment(errc)) {
    const fs::path& entryPath = iter->path();

    if (entryPath.extension() != ENTRY_EXTENSION && entryPath.extension() != ".tmp")
      continue;

    std::error_code removeErrc;

    if (fs::remove(entryPath, removeErrc); removeErrc)
      return Err(AlmanacError(std::format("Failed to remove {}", entryPath.string()), removeErrc));
  }

  if (errc)
    return Err(AlmanacError(std::format("Failed to list cache directory {}", m_directory->string()), errc));

  return {};
}
