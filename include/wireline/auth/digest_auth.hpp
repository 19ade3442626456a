#pragma once

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "wireline/middleware.hpp"
#include "wireline/result.hpp"

namespace wireline {

    /// @brief Digest hash algorithms (RFC 7616 section 3.3).
    enum class DigestAlgorithm : std::uint8_t {
        Md5,
        Md5Sess,
        Sha256,
        Sha256Sess,
        Sha512_256,
        Sha512_256Sess,
    };

    /// @brief Wire name, e.g. "SHA-256-sess".
    const char* to_string(DigestAlgorithm algorithm) noexcept;

    /// @brief Case-insensitive lookup of an algorithm name.
    std::optional<DigestAlgorithm> parse_digest_algorithm(std::string_view name);

    /// @brief Lower-case hex digest of data with the algorithm's hash.
    /// @note Fails when the crypto library refuses the hash (e.g. MD5 in a
    /// FIPS configuration).
    Result<std::string> digest_hash(DigestAlgorithm algorithm,
                                    std::string_view data);

    /// @brief Parameters of one `WWW-Authenticate: Digest` challenge.
    struct DigestChallenge {
        std::string realm;
        std::string nonce;
        std::string opaque;
        DigestAlgorithm algorithm{DigestAlgorithm::Md5};
        /// Offered qop values, lower-case; empty for RFC 2069 style.
        std::vector<std::string> qop_options;
        /// Protection space URIs from the `domain` parameter.
        std::vector<std::string> domain;
        bool stale{false};
        bool has_opaque{false};
    };

    /**
     * @brief Parse the parameters of a Digest challenge.
     * @param value A header value; a leading "Digest" scheme is skipped and
     * parsing stops at the next challenge in the same value.
     * @return AuthChallenge error when realm or nonce is missing, the
     * algorithm is unknown, or qop offers nothing usable.
     */
    Result<DigestChallenge> parse_digest_challenge(std::string_view value);

    /// @brief The first Digest challenge among the WWW-Authenticate values.
    std::optional<std::string> find_digest_challenge(const Headers& headers);

    /// @brief Inputs of one Authorization computation.
    struct DigestInput {
        std::string username;
        std::string password;
        std::string method;
        /// Request target exactly as sent on the request line.
        std::string uri;
        /// Chosen qop ("auth", "auth-int") or empty.
        std::string qop;
        std::string cnonce;
        std::uint32_t nonce_count{1};
        /// Entity body, only hashed for auth-int.
        std::string_view body;
    };

    /// @brief The `response` parameter per RFC 7616 section 3.4.1.
    Result<std::string> compute_digest_response(const DigestChallenge& challenge,
                                                const DigestInput& input);

    /// @brief Full `Authorization` header value for the input.
    Result<std::string> build_digest_authorization(
        const DigestChallenge& challenge, const DigestInput& input);

    /**
     * @brief Middleware answering Digest challenges (RFC 7616).
     *
     * On a 401 carrying a Digest challenge the request is re-issued once
     * with credentials; a second 401 is returned to the caller. Later
     * requests into a known protection space are authorized up front with
     * the next nonce-count.
     *
     * SAFETY:
     * - Thread-safe; per protection space state is updated under a mutex,
     *   the last nonce issued by the server wins.
     */
    class DigestAuthMiddleware : public Middleware {
       public:
        using CnonceGenerator = std::function<std::string()>;

        DigestAuthMiddleware(std::string username, std::string password);

        /// @param cnonce Client nonce source (tests pass a fixed one).
        DigestAuthMiddleware(std::string username, std::string password,
                             CnonceGenerator cnonce);

        boost::asio::awaitable<Result<Response>> handle(Request& req,
                                                        Next next) override;

        /// @brief Per (origin, realm) state, as observed by the caller.
        struct Snapshot {
            std::string nonce;
            std::uint32_t nonce_count{0};
            std::string qop;
            DigestAlgorithm algorithm{DigestAlgorithm::Md5};
        };

        /// @param origin "scheme://host[:port]" as in origin_of().
        std::optional<Snapshot> context(std::string_view origin,
                                        std::string_view realm) const;

       private:
        struct Space {
            DigestChallenge challenge;
            std::string qop;
            std::uint32_t nonce_count{0};
        };

        using SpaceKey = std::pair<std::string, std::string>;

        /// @brief Build the Authorization value for req if a protection
        /// space covers it, consuming the next nonce-count.
        Result<std::optional<std::string>> authorize_(const std::string& origin,
                                                      const std::string& uri,
                                                      const Request& req);

        /// @brief Install a fresh challenge for its realm.
        void remember_(const std::string& origin, DigestChallenge challenge);

        std::string username_;
        std::string password_;
        CnonceGenerator cnonce_;

        mutable std::mutex mu_;
        std::map<SpaceKey, Space> spaces_;
        /// Realm most recently challenged per origin.
        std::map<std::string, std::string> realm_by_origin_;
    };

}  // namespace wireline
