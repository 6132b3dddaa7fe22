#ifndef INCLUDE_RESTORA_CORE_RECOVERYMANAGER_HPP
#define INCLUDE_RESTORA_CORE_RECOVERYMANAGER_HPP

#include "restora/core/RecoveryConfig.hpp"
#include "restora/core/RecoveryError.hpp"
#include "restora/core/RecoverySerializer.hpp"
#include "restora/core/SecretSchedule.hpp"
#include "restora/core/TypeRegistry.hpp"
#include "restora/crypto/ICryptoProvider.hpp"
#include "restora/security/SecretBytes.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace restora::core
{

// Process-wide recovery configuration. Immutable after create(); safe to share across threads as long as
// the crypto provider is.
class RecoveryManager final
{
public:
    using Clock = SecretSchedule::Clock;
    using TimePoint = SecretSchedule::TimePoint;
    using NowProvider = std::function<TimePoint()>;

    [[nodiscard]] static RecoveryResult<std::unique_ptr<RecoveryManager>>
    create(const crypto::ICryptoProvider& crypto, std::vector<RecoverableType> whitelist, RecoveryOptions options,
           NowProvider nowProvider = Clock::now);

    RecoveryManager(const RecoveryManager&) = delete;
    RecoveryManager& operator=(const RecoveryManager&) = delete;
    RecoveryManager(RecoveryManager&&) = delete;
    RecoveryManager& operator=(RecoveryManager&&) = delete;
    ~RecoveryManager() = default;

    // Captures the rotating code for the current instant.
    [[nodiscard]] RecoveryResult<RecoverySerializer> spawnSerializer(std::string salt) const;

    // Throws std::invalid_argument when `target` precedes the Unix epoch.
    [[nodiscard]] RecoveryResult<RecoverySerializer> spawnSerializer(std::string salt, TimePoint target) const;

    [[nodiscard]] const TypeRegistry& registry() const noexcept
    {
        return m_registry;
    }

    [[nodiscard]] const SecretSchedule& schedule() const noexcept
    {
        return m_schedule;
    }

    [[nodiscard]] std::size_t maxValues() const noexcept
    {
        return m_maxValues;
    }

    [[nodiscard]] std::size_t maxPayloadLength() const noexcept
    {
        return m_maxPayloadLength;
    }

    [[nodiscard]] TimePoint now() const
    {
        return m_now();
    }

private:
    friend class RecoverySerializer;

    RecoveryManager(const crypto::ICryptoProvider& crypto, TypeRegistry registry, SecretSchedule schedule,
                    RecoveryOptions options, NowProvider nowProvider);

    const crypto::ICryptoProvider* m_crypto;
    TypeRegistry m_registry;
    SecretSchedule m_schedule;
    security::SecretBytes m_pepper;
    std::size_t m_maxValues;
    std::size_t m_maxPayloadLength;
    ObjectEncoder m_defaultEncoder;
    DecoderMap m_decoders;
    NowProvider m_now;
};

} // namespace restora::core

#endif // INCLUDE_RESTORA_CORE_RECOVERYMANAGER_HPP
