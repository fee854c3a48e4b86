// include/Ember/Types/AssetIndex.hpp
#ifndef EMBER_ASSETINDEX_HPP
#define EMBER_ASSETINDEX_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace Ember {
    using json = nlohmann::json;

    struct AssetIndex {
        std::string id;
        std::string sha1;
        size_t size = 0;
        size_t totalSize = 0;
        std::string url;

        static AssetIndex from_json(const json& j);
    };
}

#endif // EMBER_ASSETINDEX_HPP
