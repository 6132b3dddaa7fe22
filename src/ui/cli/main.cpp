#include "RecoveryShell.hpp"

#include "restora/core/RecoveryConfig.hpp"
#include "restora/crypto/providers/OpenSslProviderFactory.hpp"
#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    try
    {
        auto crypto{ restora::crypto::providers::makeOpenSslCryptoProvider() };
        restora::ui::cli::RecoveryShell shell{ *crypto, std::cin, std::cout, restora::core::readEnv };

        std::vector<std::string> args{};
        for (int i{ 1 }; i < argc; ++i)
        {
            args.emplace_back(argv[i]);
        }
        return shell.run(args);
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
