#include "pomelo/geoip.hpp"
#include <maxminddb.h>
#include <spdlog/spdlog.h>
#include <netdb.h>

namespace pomelo {

MaxMindGeoLookup::MaxMindGeoLookup()
    : db_(std::make_unique<MMDB_s>()), open_(false) {}

MaxMindGeoLookup::~MaxMindGeoLookup() {
    if (open_) {
        MMDB_close(db_.get());
    }
}

Error MaxMindGeoLookup::open(const std::string& path) {
    if (open_) {
        MMDB_close(db_.get());
        open_ = false;
    }

    int ec = MMDB_open(path.c_str(), MMDB_MODE_MMAP, db_.get());
    if (ec != MMDB_SUCCESS) {
        spdlog::error("geoip: cannot open {}: {}", path, MMDB_strerror(ec));
        return Error::GeoDatabase;
    }

    open_ = true;
    spdlog::info("geoip: opened {} (type: {} version: {}.{})",
                 path, db_->metadata.database_type,
                 db_->metadata.binary_format_major_version,
                 db_->metadata.binary_format_minor_version);
    return Error::Success;
}

std::optional<std::string> MaxMindGeoLookup::countryOf(
    const boost::asio::ip::address& addr
) const {
    if (!open_) {
        return std::nullopt;
    }

    std::string ip = addr.to_string();
    int gai_ec = 0;
    int mmdb_ec = 0;
    MMDB_lookup_result_s res = MMDB_lookup_string(db_.get(), ip.c_str(), &gai_ec, &mmdb_ec);

    if (gai_ec != 0) {
        spdlog::warn("geoip: lookup {} failed: {}", ip, gai_strerror(gai_ec));
        return std::nullopt;
    }
    if (mmdb_ec != MMDB_SUCCESS) {
        spdlog::warn("geoip: lookup {} failed: {}", ip, MMDB_strerror(mmdb_ec));
        return std::nullopt;
    }
    if (!res.found_entry) {
        return std::nullopt;
    }

    MMDB_entry_data_s data;
    if (MMDB_get_value(&res.entry, &data, "country", "iso_code", NULL) != MMDB_SUCCESS ||
        !data.has_data || data.type != MMDB_DATA_TYPE_UTF8_STRING) {
        return std::nullopt;
    }
    return std::string(data.utf8_string, data.data_size);
}

} // namespace pomelo
