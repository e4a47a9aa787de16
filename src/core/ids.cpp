#include "chunkvault/core/ids.h"

#include <Poco/DigestEngine.h>
#include <Poco/SHA2Engine.h>
#include <Poco/UUIDGenerator.h>

namespace chunkvault::core {

std::string GenerateRequestId() {
    return Poco::UUIDGenerator().createOne().toString();
}

std::string GenerateUploadId() {
    return Poco::UUIDGenerator().createRandom().toString();
}

std::string OwnerDigest(const std::string& owner) {
    Poco::SHA2Engine256 sha256;
    sha256.update(owner);
    return Poco::DigestEngine::digestToHex(sha256.digest());
}

}  // namespace chunkvault::core
