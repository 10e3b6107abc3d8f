#pragma once

#include <string>
#include <string_view>

#include "domain/Types.h"

namespace adapters::binance::vision {

// Path segment below /data/ for a market: "spot", "futures/um", "futures/cm".
std::string market_path(domain::MarketType market);

// Coin-margined archives are published under "<SYMBOL>_PERP".
std::string archive_symbol(const std::string& symbol, domain::MarketType market);

std::string daily_url(const std::string& baseUrl,
                      domain::MarketType market,
                      const std::string& symbol,
                      domain::Interval interval,
                      const domain::CalendarDate& date);

std::string monthly_url(const std::string& baseUrl,
                        domain::MarketType market,
                        const std::string& symbol,
                        domain::Interval interval,
                        int year,
                        int month);

// Returns the contents of the archive's CSV entry (the first entry when no
// name ends in ".csv"). Stored and deflated entries are supported; the
// entry's CRC-32 is verified. Throws ValidationError{IntegrityCheckFailed}.
std::string extract_csv(const std::string& zipBytes);

// Hex digest from a "<sha256>  <file name>" CHECKSUM companion.
// Throws ValidationError{SchemaInvalid} when no digest is present.
std::string parse_checksum(const std::string& body);

// Kline rows in archive column order. A leading header row is skipped and
// microsecond timestamps are brought to milliseconds.
// Throws ValidationError{SchemaInvalid} on malformed rows.
domain::BarSequence parse_kline_csv(std::string_view csv);

}  // namespace adapters::binance::vision
