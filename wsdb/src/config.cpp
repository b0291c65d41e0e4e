#include <wsdb/config.hpp>

#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/log/utility/setup/settings_parser.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <lib/system/logger.hpp>
#include <lib/system/utils.hpp>

namespace wsdb {

namespace {
constexpr uint64_t kMsInSecond = 1000;
constexpr uint64_t kSecondsInDay = 24 * 60 * 60;
}  // namespace

Config Config::readFromFile(const std::string& fileName) {
    Config result;

    boost::property_tree::ptree config;

    try {
        auto ext = boost::filesystem::path(fileName).extension().string();
        boost::algorithm::to_lower(ext);
        if (ext == ".json") {
            boost::property_tree::read_json(fileName, config);
        }
        else if (ext == ".xml") {
            boost::property_tree::read_xml(fileName, config);
        }
        else {
            boost::property_tree::read_ini(fileName, config);
        }
    }
    catch (boost::property_tree::file_parser_error& e) {
        wserror() << "Couldn't read config file \"" << fileName << "\": " << e.what();
        return result;
    }

    return readFromTree(config);
}

Config Config::readFromTree(const boost::property_tree::ptree& config) {
    Config result;

    try {
        result.setLoggerSettings(config);
        result.good_ = result.readStorageData(config);
    }
    catch (boost::property_tree::ptree_bad_data& e) {
        wserror() << e.what() << ": " << e.data<std::string>();
    }
    catch (boost::property_tree::ptree_error& e) {
        wserror() << "Errors in config file: " << e.what();
    }
    catch (std::exception& e) {
        wserror() << "Errors in config file: " << e.what();
    }

    return result;
}

void Config::setLoggerSettings(const boost::property_tree::ptree& config) {
    boost::property_tree::ptree settings;
    auto core = config.get_child_optional("Core");
    if (core) {
        settings.add_child("Core", *core);
    }
    auto sinks = config.get_child_optional("Sinks");
    if (sinks) {
        for (const auto& val : *sinks) {
            settings.add_child(boost::property_tree::ptree::path_type("Sinks." + val.first, '/'), val.second);
        }
    }
    for (const auto& item : config) {
        if (item.first.find("Sinks.") == 0) {
            settings.add_child(boost::property_tree::ptree::path_type(item.first, '/'), item.second);
        }
    }
    std::stringstream ss;
    boost::property_tree::write_ini(ss, settings);
    loggerSettings_ = boost::log::parse_settings(ss);
}

bool Config::readStorageData(const boost::property_tree::ptree& config) {
    const std::string& block = BLOCK_NAME_STORAGE;

    if (!config.count(block)) {
        return true;
    }

    const boost::property_tree::ptree& data = config.get_child(block);

    if (data.count(PARAM_NAME_PATH)) {
        pathToDb_ = data.get<std::string>(PARAM_NAME_PATH);
        if (pathToDb_.empty()) {
            wserror() << "Config> [" << block << "] " << PARAM_NAME_PATH << " must not be empty";
            return false;
        }
    }

    uint64_t cursorLifetime = cursorLifetime_ / kMsInSecond;
    uint64_t defaultTtl = allowanceDefaultTtl_ / kMsInSecond;
    uint64_t maxTtl = allowanceMaxTtl_ / kMsInSecond;
    uint64_t cacheSize = cacheSize_;
    uint64_t pageSize = pageSize_;

    bool ok = checkAndSaveValue<uint64_t>(data, block, PARAM_NAME_CACHE_SIZE, cacheSize, 1024 * 1024, 4ull * 1024 * 1024 * 1024);
    ok = checkAndSaveValue<uint64_t>(data, block, PARAM_NAME_CURSOR_LIFETIME, cursorLifetime, 1, 365 * kSecondsInDay) && ok;
    ok = checkAndSaveValue<uint64_t>(data, block, PARAM_NAME_ALLOWANCE_MAX_TTL, maxTtl, 1, 30 * kSecondsInDay) && ok;
    ok = checkAndSaveValue<uint64_t>(data, block, PARAM_NAME_ALLOWANCE_DEFAULT_TTL, defaultTtl, 1, 30 * kSecondsInDay) && ok;
    ok = checkAndSaveValue<uint64_t>(data, block, PARAM_NAME_PAGE_SIZE, pageSize, 1, 10000) && ok;

    if (defaultTtl > maxTtl) {
        wserror() << "Config> [" << block << "] " << PARAM_NAME_ALLOWANCE_DEFAULT_TTL << " exceeds " << PARAM_NAME_ALLOWANCE_MAX_TTL;
        ok = false;
    }

    cacheSize_ = ws::numeric_cast<size_t>(cacheSize);
    pageSize_ = ws::numeric_cast<size_t>(pageSize);
    cursorLifetime_ = cursorLifetime * kMsInSecond;
    allowanceDefaultTtl_ = defaultTtl * kMsInSecond;
    allowanceMaxTtl_ = maxTtl * kMsInSecond;
    return ok;
}

template <typename T>
bool Config::checkAndSaveValue(const boost::property_tree::ptree& data, const std::string& block, const std::string& param, T& value, T min,
                               T max) {
    if (!data.count(param)) {
        return true;
    }

    const auto readValue = data.get<T>(param);
    if (readValue > max || readValue < min) {
        wserror() << "Config> Please, check the block: [" << block << "], so that param: [" << param << "], will be: [" << min << ", " << max
                  << "]";
        return false;
    }

    value = readValue;
    return true;
}

}  // namespace wsdb
