#ifndef INCLUDE_RESTORA_CORE_RECOVERYSERIALIZER_HPP
#define INCLUDE_RESTORA_CORE_RECOVERYSERIALIZER_HPP

#include "restora/core/RecoveryError.hpp"
#include "restora/core/TypeRegistry.hpp"
#include "restora/core/Value.hpp"
#include "restora/security/SecretBytes.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <span>
#include <string>
#include <string_view>

namespace restora::core
{

class RecoveryManager;

struct RecoveryToken final
{
    std::string typeId;
    // URL-safe base64 of the canonical JSON.
    std::string payload;
    // Lowercase hex SHA-256.
    std::string signature;

    bool operator==(const RecoveryToken& other) const = default;
};

using TokenMap = std::map<std::string, RecoveryToken, std::less<>>;
using ValueMap = std::map<std::string, Value, std::less<>>;

[[nodiscard]] RecoveryToken nullToken();

// Request-scoped. Bound to one rotating code and one salt; borrows everything else from the manager,
// which must outlive it. Not for concurrent use.
class RecoverySerializer final
{
public:
    RecoverySerializer(const RecoverySerializer&) = delete;
    RecoverySerializer& operator=(const RecoverySerializer&) = delete;
    RecoverySerializer(RecoverySerializer&&) noexcept = default;
    RecoverySerializer& operator=(RecoverySerializer&&) noexcept = default;
    ~RecoverySerializer() = default;

    // All-or-nothing: the first failing entry aborts the batch.
    [[nodiscard]] RecoveryResult<TokenMap> serializeAll(const ValueMap& values) const;
    [[nodiscard]] RecoveryResult<RecoveryToken> serialize(std::string_view name, const Value& value) const;

    // All-or-nothing: any forged, stale or malformed entry rejects the whole batch.
    [[nodiscard]] RecoveryResult<ValueMap> deserializeAll(const TokenMap& tokens) const;
    [[nodiscard]] RecoveryResult<Value> deserialize(std::string_view name, const RecoveryToken& token) const;

    [[nodiscard]] std::string_view salt() const noexcept
    {
        return m_salt;
    }

private:
    friend class RecoveryManager;

    RecoverySerializer(const RecoveryManager& manager, security::SecretBytes code, std::string salt) noexcept;

    // hex(SHA256(typeId | json | pepper | code | salt | name)); the order is part of the wire contract.
    [[nodiscard]] RecoveryResult<std::string> sign(std::string_view typeId, std::span<const std::byte> json,
                                                   std::string_view name) const;

    [[nodiscard]] RecoveryResult<std::string> encodeCanonical(const TypeEntry& entry, const Value& value) const;
    [[nodiscard]] RecoveryResult<Value> reconstruct(const TypeEntry& entry, const nlohmann::json& json) const;

    const RecoveryManager* m_manager;
    security::SecretBytes m_code;
    std::string m_salt;
};

} // namespace restora::core

#endif // INCLUDE_RESTORA_CORE_RECOVERYSERIALIZER_HPP
