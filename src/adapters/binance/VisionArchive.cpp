#include "adapters/binance/VisionArchive.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <vector>

#include <boost/crc.hpp>
#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filter/zlib.hpp>
#include <boost/iostreams/filtering_streambuf.hpp>

#include "adapters/binance/IntervalMap.hpp"
#include "common/Errors.hpp"
#include "core/TimeUtils.h"

namespace adapters::binance::vision {
namespace {

using kvault::common::ErrorKind;
using kvault::common::ValidationError;

constexpr std::uint32_t kEndOfCentralDirectory = 0x06054b50U;
constexpr std::uint32_t kCentralDirectoryEntry = 0x02014b50U;
constexpr std::uint32_t kLocalFileHeader = 0x04034b50U;
constexpr std::size_t kEndOfCentralDirectorySize = 22;
constexpr std::size_t kCentralEntryFixedSize = 46;
constexpr std::size_t kLocalHeaderFixedSize = 30;
constexpr std::uint16_t kMethodStored = 0;
constexpr std::uint16_t kMethodDeflated = 8;
constexpr std::size_t kMaxInflateRatio = 64;

ValidationError corrupt(const std::string& message) {
    return ValidationError(ErrorKind::IntegrityCheckFailed, "zip archive: " + message);
}

std::uint16_t read16(const std::string& bytes, std::size_t offset) {
    if (offset + 2 > bytes.size()) {
        throw corrupt("truncated at offset " + std::to_string(offset));
    }
    return static_cast<std::uint16_t>(static_cast<unsigned char>(bytes[offset]) |
                                      (static_cast<unsigned char>(bytes[offset + 1]) << 8U));
}

std::uint32_t read32(const std::string& bytes, std::size_t offset) {
    return static_cast<std::uint32_t>(read16(bytes, offset)) |
           (static_cast<std::uint32_t>(read16(bytes, offset + 2)) << 16U);
}

struct ZipEntry {
    std::string name;
    std::uint16_t method{0};
    std::uint32_t crc32{0};
    std::uint32_t compressedSize{0};
    std::uint32_t uncompressedSize{0};
    std::uint32_t localHeaderOffset{0};
};

std::size_t findEndOfCentralDirectory(const std::string& bytes) {
    if (bytes.size() < kEndOfCentralDirectorySize) {
        throw corrupt("too short (" + std::to_string(bytes.size()) + " bytes)");
    }
    const std::size_t lowest = bytes.size() > kEndOfCentralDirectorySize + 0xFFFFU
                                   ? bytes.size() - kEndOfCentralDirectorySize - 0xFFFFU
                                   : 0;
    for (std::size_t pos = bytes.size() - kEndOfCentralDirectorySize + 1; pos-- > lowest;) {
        if (read32(bytes, pos) == kEndOfCentralDirectory) {
            return pos;
        }
    }
    throw corrupt("end of central directory not found");
}

std::vector<ZipEntry> readCentralDirectory(const std::string& bytes) {
    const auto eocd = findEndOfCentralDirectory(bytes);
    const auto entryCount = read16(bytes, eocd + 10);
    std::size_t offset = read32(bytes, eocd + 16);

    std::vector<ZipEntry> entries;
    entries.reserve(entryCount);
    for (std::uint16_t i = 0; i < entryCount; ++i) {
        if (read32(bytes, offset) != kCentralDirectoryEntry) {
            throw corrupt("bad central directory signature");
        }
        ZipEntry entry;
        entry.method = read16(bytes, offset + 10);
        entry.crc32 = read32(bytes, offset + 16);
        entry.compressedSize = read32(bytes, offset + 20);
        entry.uncompressedSize = read32(bytes, offset + 24);
        const auto nameLength = read16(bytes, offset + 28);
        const auto extraLength = read16(bytes, offset + 30);
        const auto commentLength = read16(bytes, offset + 32);
        entry.localHeaderOffset = read32(bytes, offset + 42);
        if (offset + kCentralEntryFixedSize + nameLength > bytes.size()) {
            throw corrupt("truncated entry name");
        }
        entry.name = bytes.substr(offset + kCentralEntryFixedSize, nameLength);
        entries.push_back(std::move(entry));
        offset += kCentralEntryFixedSize + nameLength + extraLength + commentLength;
    }
    return entries;
}

std::string inflateRaw(const char* data, std::size_t size, std::size_t expectedSize) {
    namespace io = boost::iostreams;

    io::zlib_params params;
    params.noheader = true;

    std::string output;
    // The header's size is only a hint until the CRC has been checked.
    output.reserve(std::min<std::size_t>(expectedSize, kMaxInflateRatio * size));
    try {
        io::filtering_istreambuf input;
        input.push(io::zlib_decompressor(params));
        input.push(io::array_source(data, size));
        io::copy(input, io::back_inserter(output));
    } catch (const io::zlib_error& ex) {
        throw corrupt(std::string{"inflate failed: "} + ex.what());
    }
    return output;
}

bool endsWith(const std::string& value, std::string_view suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string_view> splitFields(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t begin = 0;
    while (true) {
        const auto comma = line.find(',', begin);
        fields.push_back(line.substr(begin, comma == std::string_view::npos ? std::string_view::npos : comma - begin));
        if (comma == std::string_view::npos) {
            break;
        }
        begin = comma + 1;
    }
    return fields;
}

bool looksNumeric(std::string_view field) {
    return !field.empty() &&
           (std::isdigit(static_cast<unsigned char>(field.front())) != 0 || field.front() == '-');
}

std::int64_t toInt64(std::string_view field, std::size_t lineNumber) {
    try {
        std::size_t consumed = 0;
        const std::string text{field};
        const auto value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::exception&) {
        throw ValidationError(ErrorKind::SchemaInvalid,
                              "line " + std::to_string(lineNumber) + ": bad integer '" + std::string{field} + "'");
    }
}

double toDouble(std::string_view field, std::size_t lineNumber) {
    try {
        std::size_t consumed = 0;
        const std::string text{field};
        const auto value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::exception&) {
        throw ValidationError(ErrorKind::SchemaInvalid,
                              "line " + std::to_string(lineNumber) + ": bad number '" + std::string{field} + "'");
    }
}

}  // namespace

std::string market_path(domain::MarketType market) {
    switch (market) {
    case domain::MarketType::Spot:
        return "spot";
    case domain::MarketType::FuturesUsdt:
        return "futures/um";
    case domain::MarketType::FuturesCoin:
        return "futures/cm";
    }
    return "spot";
}

std::string archive_symbol(const std::string& symbol, domain::MarketType market) {
    if (market == domain::MarketType::FuturesCoin && !endsWith(symbol, "_PERP")) {
        return symbol + "_PERP";
    }
    return symbol;
}

std::string daily_url(const std::string& baseUrl,
                      domain::MarketType market,
                      const std::string& symbol,
                      domain::Interval interval,
                      const domain::CalendarDate& date) {
    const auto name = archive_symbol(symbol, market);
    const auto literal = binance_interval(interval);
    std::ostringstream url;
    url << baseUrl << "/data/" << market_path(market) << "/daily/klines/" << name << '/' << literal << '/' << name
        << '-' << literal << '-' << core::formatIsoDate(date) << ".zip";
    return url.str();
}

std::string monthly_url(const std::string& baseUrl,
                        domain::MarketType market,
                        const std::string& symbol,
                        domain::Interval interval,
                        int year,
                        int month) {
    const auto name = archive_symbol(symbol, market);
    const auto literal = binance_interval(interval);
    std::ostringstream url;
    url << baseUrl << "/data/" << market_path(market) << "/monthly/klines/" << name << '/' << literal << '/' << name
        << '-' << literal << '-' << core::formatMonth(year, month) << ".zip";
    return url.str();
}

std::string extract_csv(const std::string& zipBytes) {
    const auto entries = readCentralDirectory(zipBytes);
    if (entries.empty()) {
        throw corrupt("archive has no entries");
    }
    auto it = std::find_if(entries.begin(), entries.end(), [](const ZipEntry& e) { return endsWith(e.name, ".csv"); });
    const ZipEntry& entry = it != entries.end() ? *it : entries.front();

    const std::size_t header = entry.localHeaderOffset;
    if (read32(zipBytes, header) != kLocalFileHeader) {
        throw corrupt("bad local header signature for " + entry.name);
    }
    const std::size_t dataOffset =
        header + kLocalHeaderFixedSize + read16(zipBytes, header + 26) + read16(zipBytes, header + 28);
    if (dataOffset + entry.compressedSize > zipBytes.size()) {
        throw corrupt("entry " + entry.name + " runs past the end of the archive");
    }

    std::string content;
    const char* data = zipBytes.data() + dataOffset;
    if (entry.method == kMethodStored) {
        content.assign(data, entry.compressedSize);
    } else if (entry.method == kMethodDeflated) {
        content = inflateRaw(data, entry.compressedSize, entry.uncompressedSize);
    } else {
        throw corrupt("unsupported compression method " + std::to_string(entry.method) + " for " + entry.name);
    }

    if (content.size() != entry.uncompressedSize) {
        throw corrupt("entry " + entry.name + " inflated to " + std::to_string(content.size()) + " bytes, expected " +
                      std::to_string(entry.uncompressedSize));
    }
    boost::crc_32_type crc;
    crc.process_bytes(content.data(), content.size());
    if (crc.checksum() != entry.crc32) {
        throw corrupt("CRC mismatch for " + entry.name);
    }
    return content;
}

std::string parse_checksum(const std::string& body) {
    std::string digest;
    for (const char c : body) {
        if (std::isxdigit(static_cast<unsigned char>(c)) == 0) {
            break;
        }
        digest.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (digest.size() != 64) {
        throw ValidationError(ErrorKind::SchemaInvalid, "CHECKSUM file does not start with a SHA-256 digest");
    }
    return digest;
}

domain::BarSequence parse_kline_csv(std::string_view csv) {
    domain::BarSequence bars;
    std::size_t lineNumber = 0;
    std::size_t begin = 0;
    while (begin < csv.size()) {
        auto end = csv.find('\n', begin);
        if (end == std::string_view::npos) {
            end = csv.size();
        }
        auto line = csv.substr(begin, end - begin);
        begin = end + 1;
        ++lineNumber;

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            continue;
        }

        const auto fields = splitFields(line);
        if (lineNumber == 1 && !looksNumeric(fields.front())) {
            continue;
        }
        if (fields.size() < 7) {
            throw ValidationError(ErrorKind::SchemaInvalid,
                                  "line " + std::to_string(lineNumber) + ": expected at least 7 columns, got " +
                                      std::to_string(fields.size()));
        }

        domain::Bar bar{};
        bar.openTime = core::normalizeEpochMs(toInt64(fields[0], lineNumber));
        bar.open = toDouble(fields[1], lineNumber);
        bar.high = toDouble(fields[2], lineNumber);
        bar.low = toDouble(fields[3], lineNumber);
        bar.close = toDouble(fields[4], lineNumber);
        bar.volume = toDouble(fields[5], lineNumber);
        bar.closeTime = core::normalizeEpochMs(toInt64(fields[6], lineNumber));
        if (fields.size() > 7) {
            bar.quoteVolume = toDouble(fields[7], lineNumber);
        }
        if (fields.size() > 8) {
            bar.trades = toInt64(fields[8], lineNumber);
        }
        if (fields.size() > 10) {
            bar.takerBuyBaseVolume = toDouble(fields[9], lineNumber);
            bar.takerBuyQuoteVolume = toDouble(fields[10], lineNumber);
        }
        bars.push_back(bar);
    }
    return bars;
}

}  // namespace adapters::binance::vision
