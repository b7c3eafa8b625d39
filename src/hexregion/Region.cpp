#include "hexregion/Region.hpp"

#include "hexregion/Random.hpp"

#include <chrono>

namespace hexregion {

namespace {

// Ticks between 0001-01-01 and the Unix epoch.
constexpr std::int64_t kUnixEpochTicks = 621355968000000000LL;

static int HexNibble(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

RegionId RegionId::Generate(std::uint64_t entropy)
{
  RegionId id;
  std::uint64_t state = entropy;
  const std::uint64_t a = SplitMix64Next(state);
  const std::uint64_t b = SplitMix64Next(state);
  for (int i = 0; i < 8; ++i) {
    id.bytes[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(a >> (i * 8));
    id.bytes[static_cast<std::size_t>(i + 8)] = static_cast<std::uint8_t>(b >> (i * 8));
  }
  // Version 4, RFC 4122 variant.
  id.bytes[6] = static_cast<std::uint8_t>((id.bytes[6] & 0x0Fu) | 0x40u);
  id.bytes[8] = static_cast<std::uint8_t>((id.bytes[8] & 0x3Fu) | 0x80u);
  return id;
}

bool RegionId::isNil() const
{
  for (std::uint8_t b : bytes) {
    if (b != 0) return false;
  }
  return true;
}

std::string RegionId::toString() const
{
  static const char* hex = "0123456789abcdef";
  std::string s;
  s.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) s.push_back('-');
    s.push_back(hex[(bytes[i] >> 4) & 0xF]);
    s.push_back(hex[bytes[i] & 0xF]);
  }
  return s;
}

bool RegionId::Parse(const std::string& text, RegionId& out)
{
  RegionId id;
  std::size_t byte = 0;
  int hi = -1;
  for (char c : text) {
    if (c == '-') continue;
    const int v = HexNibble(c);
    if (v < 0) return false;
    if (byte >= id.bytes.size()) return false;
    if (hi < 0) {
      hi = v;
    } else {
      id.bytes[byte++] = static_cast<std::uint8_t>((hi << 4) | v);
      hi = -1;
    }
  }
  if (byte != id.bytes.size() || hi >= 0) return false;
  out = id;
  return true;
}

bool RegionConnection::operator==(const RegionConnection& o) const
{
  return targetId == o.targetId && targetName == o.targetName && departurePortIndex == o.departurePortIndex &&
         arrivalPortIndex == o.arrivalPortIndex && travelTimeMinutes == o.travelTimeMinutes &&
         dangerLevel == o.dangerLevel;
}

std::int64_t NowTicks()
{
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto us = std::chrono::duration_cast<std::chrono::microseconds>(now).count();
  return kUnixEpochTicks + static_cast<std::int64_t>(us) * 10;
}

void RegionData::reset(int width, int height)
{
  m_w = (width > 0) ? width : 0;
  m_h = (height > 0) ? height : 0;
  m_cells.assign(static_cast<std::size_t>(m_w) * static_cast<std::size_t>(m_h), CellData{});
  for (int z = 0; z < m_h; ++z) {
    for (int x = 0; x < m_w; ++x) {
      CellData& c = at(x, z);
      c.x = static_cast<std::int16_t>(x);
      c.z = static_cast<std::int16_t>(z);
    }
  }
}

int RegionData::neighborIndex(int index, HexDirection d) const
{
  if (index < 0 || static_cast<std::size_t>(index) >= m_cells.size()) return -1;
  const OffsetCoord n = NeighborOffset(coordOf(index), d);
  return inBounds(n) ? indexOf(n) : -1;
}

const CellData* RegionData::neighbor(int x, int z, HexDirection d) const
{
  if (!inBounds(x, z)) return nullptr;
  return tryGet(NeighborOffset(OffsetCoord{x, z}, d));
}

RegionMetadata RegionData::metadata() const
{
  RegionMetadata m;
  m.id = id;
  m.name = name;
  m.width = m_w;
  m.height = m_h;
  m.seed = seed;
  m.generatedAtTicks = generatedAtTicks;
  m.connections = connections;
  return m;
}

int RegionData::landCellCount() const
{
  int n = 0;
  for (const CellData& c : m_cells) {
    if (!c.isUnderwater()) ++n;
  }
  return n;
}

bool IsValidRegionSize(int width, int height)
{
  return width >= kMinRegionSize && width <= kMaxRegionSize && height >= kMinRegionSize && height <= kMaxRegionSize;
}

} // namespace hexregion
