#include "ids.h"

#include <array>

#include <uuid/uuid.h>

namespace datalens {

auto GenerateUuid() -> std::string {
    uuid_t binuuid;
    uuid_generate_random(binuuid);
    std::array<char, 37> uuid{};
    uuid_unparse_lower(binuuid, uuid.data());
    return {uuid.data()};
}

} // namespace datalens
