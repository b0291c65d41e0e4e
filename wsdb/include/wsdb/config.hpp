#ifndef _WSDB_CONFIG_HPP_INCLUDED_
#define _WSDB_CONFIG_HPP_INCLUDED_

#include <string>

#include <boost/log/utility/setup/settings.hpp>
#include <boost/property_tree/ptree.hpp>

#include <lib/system/common.hpp>

namespace wsdb {

const std::string DEFAULT_PATH_TO_CONFIG = "wsdb.ini";
const std::string DEFAULT_PATH_TO_DB = "wsdb";

const std::string BLOCK_NAME_STORAGE = "storage";
const std::string PARAM_NAME_PATH = "path";
const std::string PARAM_NAME_CACHE_SIZE = "cache_size";
const std::string PARAM_NAME_CURSOR_LIFETIME = "cursor_lifetime";
const std::string PARAM_NAME_ALLOWANCE_DEFAULT_TTL = "allowance_default_ttl";
const std::string PARAM_NAME_ALLOWANCE_MAX_TTL = "allowance_max_ttl";
const std::string PARAM_NAME_PAGE_SIZE = "page_size";

/**
 * @brief Storage and logger settings.
 *
 * The [storage] block:
 *   path                   database directory
 *   cache_size             LevelDB block cache, bytes
 *   cursor_lifetime        seconds a pagination cursor stays valid
 *   allowance_default_ttl  seconds, used when an allowance carries no ttl
 *   allowance_max_ttl      seconds, upper bound of any allowance ttl
 *   page_size              default page size of listings
 *
 * Core and Sinks.* blocks are Boost.Log settings, see lib/system/logger.hpp.
 */
class Config {
public:
    Config() = default;

    static Config readFromFile(const std::string& fileName);
    static Config readFromTree(const boost::property_tree::ptree& config);

    bool isGood() const {
        return good_;
    }

    const std::string& getPathToDb() const {
        return pathToDb_;
    }

    size_t getCacheSize() const {
        return cacheSize_;
    }

    // durations below are in milliseconds
    ws::Duration getCursorLifetime() const {
        return cursorLifetime_;
    }

    ws::Duration getAllowanceDefaultTtl() const {
        return allowanceDefaultTtl_;
    }

    ws::Duration getAllowanceMaxTtl() const {
        return allowanceMaxTtl_;
    }

    size_t getPageSize() const {
        return pageSize_;
    }

    const boost::log::settings& getLoggerSettings() const {
        return loggerSettings_;
    }

private:
    void setLoggerSettings(const boost::property_tree::ptree& config);
    bool readStorageData(const boost::property_tree::ptree& config);

    template <typename T>
    bool checkAndSaveValue(const boost::property_tree::ptree& data, const std::string& block, const std::string& param, T& value, T min, T max);

    bool good_ = false;

    std::string pathToDb_ = DEFAULT_PATH_TO_DB;
    size_t cacheSize_ = 8 * 1024 * 1024;
    ws::Duration cursorLifetime_ = 24 * 60 * 60 * 1000ull;
    ws::Duration allowanceDefaultTtl_ = 24 * 60 * 60 * 1000ull;
    ws::Duration allowanceMaxTtl_ = 30 * 24 * 60 * 60 * 1000ull;
    size_t pageSize_ = 50;

    boost::log::settings loggerSettings_;
};

}  // namespace wsdb

#endif  // _WSDB_CONFIG_HPP_INCLUDED_
