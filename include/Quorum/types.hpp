#ifndef QUORUM_TYPES
#define QUORUM_TYPES

#include <data/tools.hpp>
#include <data/math.hpp>
#include <data/numbers.hpp>
#include <data/net/JSON.hpp>
#include <Gigamonkey.hpp>

#include <filesystem>

namespace Quorum {
    using namespace data;
    namespace Bitcoin = Gigamonkey::Bitcoin;
    namespace HD = Gigamonkey::HD;
    namespace secp256k1 = Gigamonkey::secp256k1;
    using digest256 = Gigamonkey::digest256;
    using digest160 = Gigamonkey::digest160;
    using filepath = std::filesystem::path;
}

#endif
