/**
 * @file main.cpp
 * @brief Issue and check CSRF form tokens for one session
 *
 * Usage: form_token_demo [settings-file]
 *
 * The optional settings file configures logging (log.level, log.console,
 * log.file, log.max_file_size_mb). The demo stores a session secret as
 * text, renders three forms, then checks a genuine submission, a
 * tampered one and garbage.
 *
 * Copyright (c) 2024 CsrfGuard. All rights reserved.
 */

#include <CsrfGuard/Core/Config.hpp>
#include <CsrfGuard/Core/Logger.hpp>
#include <CsrfGuard/Token/MaskedToken.hpp>
#include <CsrfGuard/Token/SecretToken.hpp>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace CsrfGuard;
using namespace CsrfGuard::Token;

namespace {

bool setupLogging(int argc, char* argv[]) {
    Config::LoggingSettings settings;

    if (argc > 1) {
        Config::ConfigLoader loader;
        auto config = loader.load(argv[1]);
        if (config.isFailure()) {
            std::cerr << "Cannot read " << argv[1] << ": "
                      << getErrorMessage(config.error()) << std::endl;
            return false;
        }

        auto parsed = Config::parseLoggingSettings(config.value());
        if (parsed.isFailure()) {
            std::cerr << "Bad logging settings in " << argv[1] << ": "
                      << getErrorMessage(parsed.error()) << std::endl;
            return false;
        }
        settings = parsed.value();
    }

    auto applied = Config::applyLoggingSettings(settings);
    if (applied.isFailure()) {
        std::cerr << "Logger setup failed: " << getErrorMessage(applied.error()) << std::endl;
        return false;
    }
    return true;
}

// The check a request handler performs on a submitted form field
bool acceptSubmission(const std::string& storedSecret, const std::string& submitted) {
    auto secret = SecretToken::fromBase64(storedSecret);
    if (secret.isFailure()) {
        CSRFGUARD_LOG_ERROR("Session holds a corrupt CSRF secret");
        return false;
    }

    auto token = MaskedToken::fromBase64(submitted);
    if (token.isFailure()) {
        std::cout << "  rejected (" << getErrorMessage(token.error()) << ")" << std::endl;
        return false;
    }

    if (token.value().unmask() != secret.value()) {
        std::cout << "  rejected (secret mismatch)" << std::endl;
        return false;
    }

    std::cout << "  accepted" << std::endl;
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    if (!setupLogging(argc, argv)) {
        return 1;
    }

    try {
        // Session start
        const std::string storedSecret = SecretToken::generate().toBase64();
        std::cout << "session secret: " << storedSecret << std::endl;

        auto secret = SecretToken::fromBase64(storedSecret);
        if (secret.isFailure()) {
            std::cerr << getErrorMessage(secret.error()) << std::endl;
            return 1;
        }

        // Three renders of the same form
        std::vector<std::string> rendered;
        for (int i = 0; i < 3; ++i) {
            rendered.push_back(MaskedToken::generate(secret.value()).toBase64());
            std::cout << "form " << i + 1 << " token: " << rendered.back() << std::endl;
        }

        std::cout << "genuine submission " << rendered[1] << std::endl;
        const bool genuine = acceptSubmission(storedSecret, rendered[1]);

        auto forged = MaskedToken::fromBase64(rendered[0]);
        std::string tampered = MaskedToken::fromValue(forged.value().value() ^ 0x1).toBase64();
        std::cout << "tampered submission " << tampered << std::endl;
        const bool tamperedAccepted = acceptSubmission(storedSecret, tampered);

        std::cout << "garbage submission" << std::endl;
        const bool garbageAccepted = acceptSubmission(storedSecret, "<script>");

        Core::Logger::Instance().Shutdown();
        return (genuine && !tamperedAccepted && !garbageAccepted) ? 0 : 1;

    } catch (const std::runtime_error& e) {
        // Token generation without a random source
        std::cerr << "Fatal: " << e.what() << std::endl;
        Core::Logger::Instance().Shutdown();
        return 2;
    }
}
