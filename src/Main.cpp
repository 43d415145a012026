#include "Codec.hpp"
#include "Crypto.hpp"
#include "Curve.hpp"
#include "CurveEnumerator.hpp"
#include "KeyAgreement.hpp"
#include "Logger.hpp"
#include "Participant.hpp"
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace toy_ecc {

namespace {
    struct CommandLine {
        std::string command;
        std::map<std::string, std::string> options;
        bool quiet = false;
    };

    void printUsage() {
        std::cerr <<
            "usage: ecc_sim [--log-level LEVEL] [--log-file PATH] [--quiet] COMMAND [options]\n"
            "\n"
            "Toy ECC over y^2 = x^3 + 2x + 3 (mod 97), G = (0, 10), n = 50.\n"
            "NOT SECURE: for teaching only.\n"
            "\n"
            "commands:\n"
            "  info                                       curve parameters and point count\n"
            "  points                                     every affine point, one per line\n"
            "  keygen [--private D]                       key pair (random d unless given)\n"
            "  encrypt --to X,Y --message TEXT [--ephemeral K]\n"
            "  decrypt --private D --c1 X,Y --ciphertext HEX\n"
            "  demo [--message TEXT]                      Alice encrypts, Bob decrypts\n";
    }

    CommandLine parseArguments(int argc, char* argv[]) {
        CommandLine cl;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--quiet") {
                cl.quiet = true;
            } else if (arg.rfind("--", 0) == 0) {
                if (i + 1 >= argc) {
                    throw EccError(ErrorCode::InvalidParameter, "Missing value for " + arg);
                }
                cl.options[arg.substr(2)] = argv[++i];
            } else if (cl.command.empty()) {
                cl.command = arg;
            } else {
                throw EccError(ErrorCode::InvalidParameter, "Unexpected argument: " + arg);
            }
        }
        return cl;
    }

    const std::string& requireOption(const CommandLine& cl, const std::string& name) {
        auto it = cl.options.find(name);
        if (it == cl.options.end()) {
            throw EccError(ErrorCode::InvalidParameter,
                "Command '" + cl.command + "' requires --" + name);
        }
        return it->second;
    }

    std::string optionOr(const CommandLine& cl, const std::string& name,
                         const std::string& fallback) {
        auto it = cl.options.find(name);
        return it == cl.options.end() ? fallback : it->second;
    }

    int runInfo(const CurveParams& params) {
        CurveSummary summary = CurveEnumerator::summarize(params);
        std::cout << "curve:          y^2 = x^3 + " << params.a << "x + " << params.b
                  << " (mod " << params.p << ")\n"
                  << "base point G:   " << Codec::formatPoint(params.generator()) << "\n"
                  << "claimed order:  " << params.n << "\n"
                  << "order verified: " << (Curve::verifyGroupOrder(params) ? "yes" : "no") << "\n"
                  << "affine points:  " << summary.pointCount << "\n"
                  << "group order:    " << summary.groupOrder << "\n";
        return 0;
    }

    int runPoints(const CurveParams& params) {
        for (const Point& point : CurveEnumerator::enumeratePoints(params)) {
            std::cout << Codec::formatPoint(point) << "\n";
        }
        return 0;
    }

    int runKeygen(const CurveParams& params, const CommandLine& cl) {
        auto it = cl.options.find("private");
        KeyPair kp = it == cl.options.end()
            ? KeyAgreement::generateKeyPair(params)
            : KeyAgreement::keyPairFromScalar(params, Codec::parseScalar(it->second));
        std::cout << "private d: " << kp.privateScalar << "\n"
                  << "public Q:  " << Codec::formatPoint(kp.publicPoint) << "\n";
        return 0;
    }

    int runEncrypt(const CurveParams& params, const CommandLine& cl) {
        Point recipient = Codec::parsePoint(requireOption(cl, "to"));
        const std::string& message = requireOption(cl, "message");

        auto it = cl.options.find("ephemeral");
        uint64_t k = it == cl.options.end()
            ? KeyAgreement::generatePrivateScalar(params)
            : Codec::parseScalar(it->second);

        HexCiphertext out = Crypto::encryptToHex(params, message, k, recipient);
        std::cout << "C1:         " << Codec::formatPoint(out.c1) << "\n"
                  << "ciphertext: " << out.ciphertextHex << "\n";
        return 0;
    }

    int runDecrypt(const CurveParams& params, const CommandLine& cl) {
        uint64_t d = Codec::parseScalar(requireOption(cl, "private"));
        Point c1 = Codec::parsePoint(requireOption(cl, "c1"));
        std::cout << Crypto::decrypt(params, std::string_view(requireOption(cl, "ciphertext")),
                                     c1, d) << "\n";
        return 0;
    }

    int runDemo(const CurveParams& params, const CommandLine& cl) {
        std::string message = optionOr(cl, "message", "Hello ECC");

        Participant alice("Alice", params);
        Participant bob("Bob", params);

        HexCiphertext sent = alice.encryptFor(bob.publicKey(), message);
        std::string received = bob.decrypt(sent.ciphertextHex, sent.c1);

        std::cout << "Bob:   d = " << bob.privateScalar()
                  << ", Q = " << Codec::formatPoint(bob.publicKey()) << "\n"
                  << "Alice: C1 = " << Codec::formatPoint(sent.c1)
                  << ", ciphertext = " << sent.ciphertextHex << "\n"
                  << "Bob decrypts: " << received << "\n";
        return received == message ? 0 : 1;
    }

    int dispatch(const CurveParams& params, const CommandLine& cl) {
        if (cl.command == "info")    return runInfo(params);
        if (cl.command == "points")  return runPoints(params);
        if (cl.command == "keygen")  return runKeygen(params, cl);
        if (cl.command == "encrypt") return runEncrypt(params, cl);
        if (cl.command == "decrypt") return runDecrypt(params, cl);
        if (cl.command == "demo")    return runDemo(params, cl);

        printUsage();
        return 1;
    }
}

} // namespace toy_ecc

int main(int argc, char* argv[]) {
    using namespace toy_ecc;

    try {
        CommandLine cl = parseArguments(argc, argv);

        // Configure logging
        Logger::setLogLevel(Logger::parseLevel(optionOr(cl, "log-level", "info")));
        if (auto it = cl.options.find("log-file"); it != cl.options.end()) {
            Logger::setLogFile(it->second);
        }
        Logger::enableConsoleOutput(!cl.quiet);

        const CurveParams params = CurveParams::toyCurve();
        Curve::validateParams(params);
        Logger::logEvent(LogLevel::Security,
            "Toy curve with non-cryptographic randomness: for teaching only, NOT SECURE");

        Logger::logEvent(LogLevel::Debug, "Running command '" + cl.command + "'");
        int rc = dispatch(params, cl);
        Logger::flush();
        return rc;
    }
    catch (const EccError& e) {
        std::cerr << "error: " << toString(e.code()) << ": " << e.what() << "\n";
        Logger::flush();
        return 1;
    }
    catch (const std::exception& e) {
        Logger::logError(ErrorCode::ProcessingError,
            std::string("Fatal error: ") + e.what());
        Logger::flush();
        return 1;
    }
}
