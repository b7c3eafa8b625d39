#include "hexregion/RegionSerializer.hpp"

#include "hexregion/AtomicFile.hpp"
#include "hexregion/HexMetrics.hpp"
#include "hexregion/Log.hpp"
#include "hexregion/PackedCell.hpp"

#include <cstring>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

namespace hexregion {

namespace {

class ByteWriter {
public:
  explicit ByteWriter(std::vector<std::uint8_t>& out) : m_out(out) {}

  void u8(std::uint8_t v) { m_out.push_back(v); }

  void u32(std::uint32_t v)
  {
    for (int i = 0; i < 4; ++i) m_out.push_back(static_cast<std::uint8_t>((v >> (i * 8)) & 0xFFu));
  }

  void u64(std::uint64_t v)
  {
    for (int i = 0; i < 8; ++i) m_out.push_back(static_cast<std::uint8_t>((v >> (i * 8)) & 0xFFu));
  }

  void i32(std::int32_t v) { u32(static_cast<std::uint32_t>(v)); }
  void i64(std::int64_t v) { u64(static_cast<std::uint64_t>(v)); }

  void f32(float v)
  {
    std::uint32_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    u32(bits);
  }

  void bytes(const std::uint8_t* p, std::size_t n) { m_out.insert(m_out.end(), p, p + n); }

  void str(const std::string& s)
  {
    i32(static_cast<std::int32_t>(s.size()));
    bytes(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
  }

  void id(const RegionId& v) { bytes(v.bytes.data(), v.bytes.size()); }

private:
  std::vector<std::uint8_t>& m_out;
};

// Readers share one interface (readBytes) so header/metadata parsing is written
// once for in-memory loads and for streamed metadata-only reads.
class BufferReader {
public:
  BufferReader(const std::uint8_t* data, std::size_t size) : m_data(data), m_size(size) {}

  bool readBytes(void* dst, std::size_t n)
  {
    if (n > m_size - m_pos) return false;
    if (n > 0) std::memcpy(dst, m_data + m_pos, n);
    m_pos += n;
    return true;
  }

  std::size_t remaining() const { return m_size - m_pos; }
  const std::uint8_t* cursor() const { return m_data + m_pos; }

private:
  const std::uint8_t* m_data = nullptr;
  std::size_t m_size = 0;
  std::size_t m_pos = 0;
};

class StreamReader {
public:
  explicit StreamReader(std::istream& is) : m_is(is) {}

  bool readBytes(void* dst, std::size_t n)
  {
    if (n == 0) return true;
    m_is.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(n));
    return static_cast<bool>(m_is);
  }

private:
  std::istream& m_is;
};

template <typename R>
bool ReadU32(R& r, std::uint32_t& out)
{
  std::uint8_t b[4];
  if (!r.readBytes(b, sizeof(b))) return false;
  out = static_cast<std::uint32_t>(b[0]) | (static_cast<std::uint32_t>(b[1]) << 8) |
        (static_cast<std::uint32_t>(b[2]) << 16) | (static_cast<std::uint32_t>(b[3]) << 24);
  return true;
}

template <typename R>
bool ReadI32(R& r, std::int32_t& out)
{
  std::uint32_t v = 0;
  if (!ReadU32(r, v)) return false;
  out = static_cast<std::int32_t>(v);
  return true;
}

template <typename R>
bool ReadI64(R& r, std::int64_t& out)
{
  std::uint32_t lo = 0;
  std::uint32_t hi = 0;
  if (!ReadU32(r, lo) || !ReadU32(r, hi)) return false;
  out = static_cast<std::int64_t>(static_cast<std::uint64_t>(lo) | (static_cast<std::uint64_t>(hi) << 32));
  return true;
}

template <typename R>
bool ReadF32(R& r, float& out)
{
  std::uint32_t bits = 0;
  if (!ReadU32(r, bits)) return false;
  std::memcpy(&out, &bits, sizeof(out));
  return true;
}

template <typename R>
bool ReadId(R& r, RegionId& out)
{
  return r.readBytes(out.bytes.data(), out.bytes.size());
}

template <typename R>
bool ReadName(R& r, std::string& out, const char* what, std::string& outError)
{
  std::int32_t len = 0;
  if (!ReadI32(r, len)) {
    outError = std::string("Truncated ") + what + " length";
    return false;
  }
  if (len < 0 || len > kMaxRegionNameBytes) {
    outError = std::string("Invalid ") + what + " length " + std::to_string(len);
    return false;
  }
  out.assign(static_cast<std::size_t>(len), '\0');
  if (len > 0 && !r.readBytes(&out[0], static_cast<std::size_t>(len))) {
    outError = std::string("Truncated ") + what;
    return false;
  }
  return true;
}

template <typename R>
bool ReadHeader(R& r, RegionMetadata& meta, std::string& outError)
{
  std::uint32_t magic = 0;
  std::uint32_t version = 0;
  if (!ReadU32(r, magic)) {
    outError = "File too small for a region header";
    return false;
  }
  if (magic != kRegionFileMagic) {
    outError = "Not a region file (bad magic)";
    return false;
  }
  if (!ReadU32(r, version)) {
    outError = "Truncated header";
    return false;
  }
  if (version > kRegionFileVersion) {
    outError = "Unsupported region file version " + std::to_string(version) + " (supported: " +
               std::to_string(kRegionFileVersion) + ")";
    return false;
  }

  std::int32_t w = 0;
  std::int32_t h = 0;
  if (!ReadId(r, meta.id) || !ReadI32(r, w) || !ReadI32(r, h)) {
    outError = "Truncated header";
    return false;
  }
  if (w < 1 || h < 1 || w > kMaxRegionDimension || h > kMaxRegionDimension) {
    outError = "Invalid region dimensions " + std::to_string(w) + "x" + std::to_string(h);
    return false;
  }
  meta.width = w;
  meta.height = h;
  return true;
}

template <typename R>
bool ReadMetadataBlock(R& r, RegionMetadata& meta, std::string& outError)
{
  if (!ReadName(r, meta.name, "region name", outError)) return false;
  if (!ReadI32(r, meta.seed) || !ReadI64(r, meta.generatedAtTicks)) {
    outError = "Truncated metadata";
    return false;
  }

  std::int32_t count = 0;
  if (!ReadI32(r, count)) {
    outError = "Truncated connection count";
    return false;
  }
  if (count < 0 || count > kMaxRegionConnections) {
    outError = "Invalid connection count " + std::to_string(count);
    return false;
  }

  meta.connections.clear();
  meta.connections.reserve(static_cast<std::size_t>(count));
  for (std::int32_t i = 0; i < count; ++i) {
    RegionConnection c;
    if (!ReadId(r, c.targetId)) {
      outError = "Truncated connection";
      return false;
    }
    if (!ReadName(r, c.targetName, "connection name", outError)) return false;
    std::int32_t dep = 0;
    std::int32_t arr = 0;
    if (!ReadI32(r, dep) || !ReadI32(r, arr) || !ReadF32(r, c.travelTimeMinutes) || !ReadF32(r, c.dangerLevel)) {
      outError = "Truncated connection";
      return false;
    }
    c.departurePortIndex = dep;
    c.arrivalPortIndex = arr;
    meta.connections.push_back(std::move(c));
  }
  return true;
}

static std::uint64_t MetadataSize(const RegionData& region)
{
  std::uint64_t n = 4 + region.name.size() + 4 + 8 + 4;
  for (const RegionConnection& c : region.connections) {
    n += 16 + 4 + c.targetName.size() + 4 + 4 + 4 + 4;
  }
  return n;
}

} // namespace

std::uint64_t EstimateRegionFileSize(const RegionData& region)
{
  return kRegionHeaderSize + MetadataSize(region) + static_cast<std::uint64_t>(region.cellCount()) * kPackedCellSize;
}

OpResult SerializeRegion(const RegionData& region, std::vector<std::uint8_t>& outBytes, const OperationContext& op)
{
  outBytes.clear();
  if (op.cancelled()) return OpResult::Cancel();

  if (region.width() < 1 || region.height() < 1 || region.width() > kMaxRegionDimension ||
      region.height() > kMaxRegionDimension) {
    return OpResult::Failure(OpStatus::ValidationFailed, "Region has invalid dimensions");
  }
  if (region.name.size() > static_cast<std::size_t>(kMaxRegionNameBytes)) {
    return OpResult::Failure(OpStatus::ValidationFailed, "Region name is too long");
  }
  if (region.connections.size() > static_cast<std::size_t>(kMaxRegionConnections)) {
    return OpResult::Failure(OpStatus::ValidationFailed, "Too many region connections");
  }
  for (const RegionConnection& c : region.connections) {
    if (c.targetName.size() > static_cast<std::size_t>(kMaxRegionNameBytes)) {
      return OpResult::Failure(OpStatus::ValidationFailed, "Connection name is too long");
    }
  }

  op.report("Serializing", 0.1f);

  std::vector<std::uint8_t> buf;
  buf.reserve(static_cast<std::size_t>(EstimateRegionFileSize(region)));
  ByteWriter w(buf);

  w.u32(kRegionFileMagic);
  w.u32(kRegionFileVersion);
  w.id(region.id);
  w.i32(region.width());
  w.i32(region.height());

  w.str(region.name);
  w.i32(region.seed);
  w.i64(region.generatedAtTicks);
  w.i32(static_cast<std::int32_t>(region.connections.size()));
  for (const RegionConnection& c : region.connections) {
    w.id(c.targetId);
    w.str(c.targetName);
    w.i32(c.departurePortIndex);
    w.i32(c.arrivalPortIndex);
    w.f32(c.travelTimeMinutes);
    w.f32(c.dangerLevel);
  }

  if (op.cancelled()) return OpResult::Cancel();

  const int total = static_cast<int>(region.cellCount());
  std::uint8_t rec[kPackedCellSize];
  for (int i = 0; i < total; ++i) {
    if (i > 0 && (i % kProgressCellInterval) == 0) {
      if (op.cancelled()) return OpResult::Cancel();
      op.report("Serializing", 0.1f + 0.7f * (static_cast<float>(i) / static_cast<float>(total)));
    }
    EncodePackedCell(PackCell(region.at(i)), rec);
    w.bytes(rec, kPackedCellSize);
  }

  outBytes = std::move(buf);
  return OpResult::Success();
}

OpResult DeserializeRegion(const std::uint8_t* data, std::size_t size, RegionData& outRegion, const OperationContext& op)
{
  if (op.cancelled()) return OpResult::Cancel();
  if (!data && size > 0) return OpResult::Failure(OpStatus::ValidationFailed, "No data");

  op.report("Reading header", 0.1f);

  BufferReader r(data, size);
  RegionMetadata meta;
  std::string err;
  if (!ReadHeader(r, meta, err) || !ReadMetadataBlock(r, meta, err)) {
    return OpResult::Failure(OpStatus::ValidationFailed, err);
  }

  if (op.cancelled()) return OpResult::Cancel();

  const std::size_t cellCount = static_cast<std::size_t>(meta.width) * static_cast<std::size_t>(meta.height);
  const std::size_t cellBytes = cellCount * kPackedCellSize;
  if (r.remaining() < cellBytes) {
    return OpResult::Failure(OpStatus::ValidationFailed,
                             "Truncated cell data (expected " + std::to_string(cellCount) + " cells)");
  }
  if (r.remaining() > cellBytes) {
    return OpResult::Failure(OpStatus::ValidationFailed, "Unexpected trailing data after cell records");
  }

  RegionData region;
  region.reset(meta.width, meta.height);
  region.id = meta.id;
  region.name = std::move(meta.name);
  region.seed = meta.seed;
  region.generatedAtTicks = meta.generatedAtTicks;
  region.connections = std::move(meta.connections);

  const std::uint8_t* cells = r.cursor();
  const int total = static_cast<int>(cellCount);
  for (int i = 0; i < total; ++i) {
    if (i > 0 && (i % kProgressCellInterval) == 0) {
      if (op.cancelled()) return OpResult::Cancel();
      op.report("Reading cells", 0.2f + 0.8f * (static_cast<float>(i) / static_cast<float>(total)));
    }

    const CellData c = UnpackCell(DecodePackedCell(cells + static_cast<std::size_t>(i) * kPackedCellSize));
    const OffsetCoord expect = region.coordOf(i);
    if (c.x != expect.x || c.z != expect.z) {
      return OpResult::Failure(OpStatus::ValidationFailed,
                               "Cell " + std::to_string(i) + " has mismatched coordinates");
    }
    if (c.incomingRiverDirection >= kHexDirectionCount || c.outgoingRiverDirection >= kHexDirectionCount) {
      return OpResult::Failure(OpStatus::ValidationFailed,
                               "Cell " + std::to_string(i) + " has an invalid river direction");
    }
    region.at(i) = c;
  }

  outRegion = std::move(region);
  op.report("Complete", 1.0f);
  return OpResult::Success();
}

OpResult SaveRegion(const RegionData& region, const std::filesystem::path& path, const OperationContext& op)
{
  op.report("Preparing", 0.0f);

  std::vector<std::uint8_t> bytes;
  OpResult res = SerializeRegion(region, bytes, op);
  if (!res.ok()) return res;

  if (op.cancelled()) return OpResult::Cancel();
  op.report("Writing file", 0.8f);

  std::string err;
  if (!WriteFileAtomic(path, bytes.data(), bytes.size(), err)) {
    Logf(LogLevel::Error, "save failed: %s", err.c_str());
    return OpResult::Failure(OpStatus::IoFailed, err);
  }

  Logf(LogLevel::Debug, "saved region '%s' (%dx%d, %zu bytes) to %s", region.name.c_str(), region.width(),
       region.height(), bytes.size(), path.string().c_str());
  op.report("Complete", 1.0f);
  return OpResult::Success();
}

OpResult LoadRegion(const std::filesystem::path& path, RegionData& outRegion, const OperationContext& op)
{
  op.report("Reading file", 0.0f);

  std::vector<std::uint8_t> bytes;
  std::string err;
  if (!ReadFileBytes(path, bytes, err)) return OpResult::Failure(OpStatus::IoFailed, err);

  OpResult res = DeserializeRegion(bytes.data(), bytes.size(), outRegion, op);
  if (res.status == OpStatus::ValidationFailed) {
    Logf(LogLevel::Warn, "rejected %s: %s", path.string().c_str(), res.message.c_str());
  }
  return res;
}

OpResult ReadRegionMetadata(const std::filesystem::path& path, RegionMetadata& outMeta)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) return OpResult::Failure(OpStatus::IoFailed, "Unable to open file: " + path.string());

  StreamReader r(f);
  RegionMetadata meta;
  std::string err;
  if (!ReadHeader(r, meta, err) || !ReadMetadataBlock(r, meta, err)) {
    return OpResult::Failure(OpStatus::ValidationFailed, err);
  }

  std::error_code ec;
  const std::uintmax_t size = std::filesystem::file_size(path, ec);
  meta.fileSizeBytes = ec ? 0 : static_cast<std::uint64_t>(size);

  outMeta = std::move(meta);
  return OpResult::Success();
}

} // namespace hexregion
