#include "restora/core/RecoveryManager.hpp"

#include <exception>
#include <span>
#include <stdexcept>
#include <utility>

namespace restora::core
{

RecoveryManager::RecoveryManager(const crypto::ICryptoProvider& crypto, TypeRegistry registry,
                                 SecretSchedule schedule, RecoveryOptions options, NowProvider nowProvider)
    : m_crypto(&crypto), m_registry(std::move(registry)), m_schedule(std::move(schedule)),
      m_pepper(security::secretBytesFrom(options.pepper)), m_maxValues(options.maxValues),
      m_maxPayloadLength(options.maxPayloadLength), m_defaultEncoder(std::move(options.defaultEncoder)),
      m_decoders(std::move(options.decoders)), m_now(std::move(nowProvider))
{
    security::secureWipe(std::as_writable_bytes(std::span{ options.pepper }));
}

RecoveryResult<std::unique_ptr<RecoveryManager>> RecoveryManager::create(const crypto::ICryptoProvider& crypto,
                                                                         std::vector<RecoverableType> whitelist,
                                                                         RecoveryOptions options,
                                                                         NowProvider nowProvider)
{
    if (options.pepper.empty() || options.interval.count() <= 0 || options.maxValues == 0U ||
        options.maxPayloadLength == 0U || !nowProvider)
    {
        return RecoveryError::ConfigurationError;
    }

    auto registry{ TypeRegistry::build(std::move(whitelist)) };
    if (isError(registry))
    {
        return std::get<RecoveryError>(registry);
    }

    // Every decoder must name a whitelisted or built-in type.
    const auto& built{ std::get<TypeRegistry>(registry) };
    for (const auto& [name, decoder] : options.decoders)
    {
        if (!decoder || built.findByName(name) == nullptr)
        {
            return RecoveryError::ConfigurationError;
        }
    }

    auto masterKey{ resolveMasterKey(crypto, options.masterKey) };
    if (isError(masterKey))
    {
        return std::get<RecoveryError>(masterKey);
    }

    SecretSchedule schedule{ crypto, std::move(std::get<security::SecretBytes>(masterKey)), options.interval };

    // Private constructor; std::make_unique cannot reach it.
    std::unique_ptr<RecoveryManager> manager{ new RecoveryManager{ crypto,
                                                                   std::move(std::get<TypeRegistry>(registry)),
                                                                   std::move(schedule), std::move(options),
                                                                   std::move(nowProvider) } };
    return manager;
}

RecoveryResult<RecoverySerializer> RecoveryManager::spawnSerializer(std::string salt) const
{
    return spawnSerializer(std::move(salt), m_now());
}

RecoveryResult<RecoverySerializer> RecoveryManager::spawnSerializer(std::string salt, TimePoint target) const
{
    const auto bucket{ m_schedule.bucketAt(target) };
    try
    {
        return RecoverySerializer{ *this, m_schedule.codeForBucket(bucket), std::move(salt) };
    }
    catch (const std::exception&)
    {
        return RecoveryError::CryptoError;
    }
}

} // namespace restora::core
