#include "wireline/auth/digest_auth.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <cstdio>

#include "wireline/log.hpp"
#include "wireline/protocol/message.hpp"
#include "wireline/url.hpp"

namespace wireline {

    namespace {

        constexpr std::string_view kScheme = "digest";

        Error challenge_error(std::string message) {
            return Error{Error::Code::AuthChallenge,
                         "malformed Digest challenge: " + std::move(message)};
        }

        bool is_sess(DigestAlgorithm a) noexcept {
            return a == DigestAlgorithm::Md5Sess ||
                   a == DigestAlgorithm::Sha256Sess ||
                   a == DigestAlgorithm::Sha512_256Sess;
        }

        const EVP_MD* md_for(DigestAlgorithm a) noexcept {
            switch (a) {
                case DigestAlgorithm::Md5:
                case DigestAlgorithm::Md5Sess:
                    return EVP_md5();
                case DigestAlgorithm::Sha256:
                case DigestAlgorithm::Sha256Sess:
                    return EVP_sha256();
                case DigestAlgorithm::Sha512_256:
                case DigestAlgorithm::Sha512_256Sess:
                    return EVP_sha512_256();
            }
            return nullptr;
        }

        std::string to_hex(const unsigned char* data, std::size_t n) {
            static constexpr char kDigits[] = "0123456789abcdef";
            std::string out;
            out.reserve(n * 2);
            for (std::size_t i = 0; i < n; ++i) {
                out += kDigits[data[i] >> 4];
                out += kDigits[data[i] & 0x0f];
            }
            return out;
        }

        /// quoted-string with '"' and '\' escaped
        std::string quote(std::string_view s) {
            std::string out;
            out.reserve(s.size() + 2);
            out += '"';
            for (char c : s) {
                if (c == '"' || c == '\\') out += '\\';
                out += c;
            }
            out += '"';
            return out;
        }

        std::string nc_hex(std::uint32_t nc) {
            std::array<char, 9> buf{};
            std::snprintf(buf.data(), buf.size(), "%08x", nc);
            return std::string(buf.data(), 8);
        }

        std::string random_cnonce() {
            std::array<unsigned char, 16> raw{};
            if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
                return {};
            }
            return to_hex(raw.data(), raw.size());
        }

        bool has_option(const std::vector<std::string>& options,
                        std::string_view value) {
            return std::find(options.begin(), options.end(), value) !=
                   options.end();
        }

        /// qop to use for a request, or nullopt when none offered is usable.
        std::optional<std::string> choose_qop(const DigestChallenge& ch,
                                              bool body_available) {
            if (ch.qop_options.empty()) return std::string{};
            if (body_available && has_option(ch.qop_options, "auth-int")) {
                return std::string("auth-int");
            }
            if (has_option(ch.qop_options, "auth")) return std::string("auth");
            return std::nullopt;
        }

        /// Whether uri falls under one of the challenge's domain URIs.
        bool in_protection_space(const DigestChallenge& ch,
                                 const std::string& origin,
                                 const std::string& uri) {
            if (ch.domain.empty()) return true;
            for (auto const& d : ch.domain) {
                std::string prefix = d;
                if (url_utils::is_absolute_url_with_protocol(d)) {
                    auto parsed = parse_url(d);
                    if (!parsed || origin_of(parsed.value()) != origin) continue;
                    prefix = parsed.value().target;
                }
                if (uri.compare(0, prefix.size(), prefix) == 0) return true;
            }
            return false;
        }

    }  // namespace

    const char* to_string(DigestAlgorithm algorithm) noexcept {
        switch (algorithm) {
            case DigestAlgorithm::Md5:
                return "MD5";
            case DigestAlgorithm::Md5Sess:
                return "MD5-sess";
            case DigestAlgorithm::Sha256:
                return "SHA-256";
            case DigestAlgorithm::Sha256Sess:
                return "SHA-256-sess";
            case DigestAlgorithm::Sha512_256:
                return "SHA-512-256";
            case DigestAlgorithm::Sha512_256Sess:
                return "SHA-512-256-sess";
        }
        return "MD5";
    }

    std::optional<DigestAlgorithm> parse_digest_algorithm(std::string_view name) {
        for (auto a : {DigestAlgorithm::Md5, DigestAlgorithm::Md5Sess,
                       DigestAlgorithm::Sha256, DigestAlgorithm::Sha256Sess,
                       DigestAlgorithm::Sha512_256,
                       DigestAlgorithm::Sha512_256Sess}) {
            if (protocol::iequals(name, to_string(a))) return a;
        }
        return std::nullopt;
    }

    Result<std::string> digest_hash(DigestAlgorithm algorithm,
                                    std::string_view data) {
        const EVP_MD* md = md_for(algorithm);
        std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
        unsigned int len = 0;
        if (!md || EVP_Digest(data.data(), data.size(), out.data(), &len, md,
                              nullptr) != 1) {
            return Result<std::string>::err(
                Error{Error::Code::AuthChallenge,
                      std::string("hash unavailable: ") + to_string(algorithm)});
        }
        return Result<std::string>::ok(to_hex(out.data(), len));
    }

    Result<DigestChallenge> parse_digest_challenge(std::string_view value) {
        using R = Result<DigestChallenge>;
        std::string_view v = protocol::trim_ows(value);
        if (v.size() >= kScheme.size() &&
            protocol::iequals(v.substr(0, kScheme.size()), kScheme) &&
            (v.size() == kScheme.size() || v[kScheme.size()] == ' ' ||
             v[kScheme.size()] == '\t')) {
            v.remove_prefix(kScheme.size());
        }

        std::map<std::string, std::string> params;
        std::size_t i = 0;
        auto skip_ws = [&] {
            while (i < v.size() && (v[i] == ' ' || v[i] == '\t')) ++i;
        };

        for (;;) {
            skip_ws();
            while (i < v.size() && v[i] == ',') {
                ++i;
                skip_ws();
            }
            if (i >= v.size()) break;

            const std::size_t name_start = i;
            while (i < v.size() && protocol::is_tchar(v[i])) ++i;
            if (i == name_start) return R::err(challenge_error("unexpected character"));
            std::string name = protocol::to_lower(v.substr(name_start, i - name_start));
            skip_ws();
            // A bare token starts the next challenge.
            if (i >= v.size() || v[i] != '=') break;
            ++i;
            skip_ws();

            std::string param;
            if (i < v.size() && v[i] == '"') {
                ++i;
                bool closed = false;
                while (i < v.size()) {
                    char c = v[i++];
                    if (c == '\\' && i < v.size()) {
                        param += v[i++];
                        continue;
                    }
                    if (c == '"') {
                        closed = true;
                        break;
                    }
                    param += c;
                }
                if (!closed) return R::err(challenge_error("unterminated quoted string"));
            } else {
                const std::size_t start = i;
                while (i < v.size() && protocol::is_tchar(v[i])) ++i;
                param.assign(v.substr(start, i - start));
            }
            params.emplace(std::move(name), std::move(param));

            skip_ws();
            if (i < v.size() && v[i] != ',') {
                return R::err(challenge_error("expected ',' between parameters"));
            }
        }

        DigestChallenge ch;
        auto realm = params.find("realm");
        if (realm == params.end()) return R::err(challenge_error("missing realm"));
        ch.realm = realm->second;

        auto nonce = params.find("nonce");
        if (nonce == params.end() || nonce->second.empty()) {
            return R::err(challenge_error("missing nonce"));
        }
        ch.nonce = nonce->second;

        if (auto it = params.find("opaque"); it != params.end()) {
            ch.opaque = it->second;
            ch.has_opaque = true;
        }
        if (auto it = params.find("algorithm"); it != params.end()) {
            auto alg = parse_digest_algorithm(it->second);
            if (!alg) {
                return R::err(Error{Error::Code::AuthChallenge,
                                    "unsupported Digest algorithm: " + it->second});
            }
            ch.algorithm = *alg;
        }
        if (auto it = params.find("qop"); it != params.end()) {
            std::string_view rest = it->second;
            bool offered = false;
            while (!rest.empty()) {
                auto comma = rest.find(',');
                auto item = protocol::trim_ows(rest.substr(0, comma));
                rest = comma == std::string_view::npos ? std::string_view{}
                                                       : rest.substr(comma + 1);
                if (item.empty()) continue;
                offered = true;
                std::string q = protocol::to_lower(item);
                if ((q == "auth" || q == "auth-int") && !has_option(ch.qop_options, q)) {
                    ch.qop_options.push_back(std::move(q));
                }
            }
            if (offered && ch.qop_options.empty()) {
                return R::err(Error{Error::Code::AuthChallenge,
                                    "no supported qop in: " + it->second});
            }
        }
        if (auto it = params.find("domain"); it != params.end()) {
            std::string_view rest = it->second;
            while (!rest.empty()) {
                auto sp = rest.find(' ');
                auto item = rest.substr(0, sp);
                rest = sp == std::string_view::npos ? std::string_view{}
                                                    : rest.substr(sp + 1);
                if (!item.empty()) ch.domain.emplace_back(item);
            }
        }
        if (auto it = params.find("stale"); it != params.end()) {
            ch.stale = protocol::iequals(it->second, "true");
        }
        return R::ok(std::move(ch));
    }

    std::optional<std::string> find_digest_challenge(const Headers& headers) {
        for (auto const& value : protocol::header_values(headers, "WWW-Authenticate")) {
            std::string_view v = value;
            for (std::size_t p = 0; p + kScheme.size() <= v.size(); ++p) {
                if (v[p] == '"') {
                    // Skip a quoted-string, honouring backslash escapes.
                    for (++p; p < v.size() && v[p] != '"'; ++p) {
                        if (v[p] == '\\') ++p;
                    }
                    continue;
                }
                const bool at_boundary =
                    p == 0 || v[p - 1] == ' ' || v[p - 1] == ',' || v[p - 1] == '\t';
                if (!at_boundary) continue;
                if (!protocol::iequals(v.substr(p, kScheme.size()), kScheme)) continue;
                const std::size_t after = p + kScheme.size();
                if (after == v.size() || v[after] == ' ' || v[after] == '\t') {
                    return std::string(v.substr(p));
                }
            }
        }
        return std::nullopt;
    }

    Result<std::string> compute_digest_response(const DigestChallenge& ch,
                                                const DigestInput& in) {
        const auto alg = ch.algorithm;

        auto ha1 = digest_hash(alg, in.username + ":" + ch.realm + ":" + in.password);
        if (!ha1) return ha1;
        std::string a1 = std::move(ha1).value();
        if (is_sess(alg)) {
            auto sess = digest_hash(alg, a1 + ":" + ch.nonce + ":" + in.cnonce);
            if (!sess) return sess;
            a1 = std::move(sess).value();
        }

        std::string a2_input = in.method + ":" + in.uri;
        if (in.qop == "auth-int") {
            auto body_hash = digest_hash(alg, in.body);
            if (!body_hash) return body_hash;
            a2_input += ":" + body_hash.value();
        }
        auto ha2 = digest_hash(alg, a2_input);
        if (!ha2) return ha2;

        if (in.qop.empty()) {
            return digest_hash(alg, a1 + ":" + ch.nonce + ":" + ha2.value());
        }
        return digest_hash(alg, a1 + ":" + ch.nonce + ":" + nc_hex(in.nonce_count) +
                                    ":" + in.cnonce + ":" + in.qop + ":" +
                                    ha2.value());
    }

    Result<std::string> build_digest_authorization(const DigestChallenge& ch,
                                                   const DigestInput& in) {
        auto response = compute_digest_response(ch, in);
        if (!response) return response;

        std::string out = "Digest username=" + quote(in.username);
        out += ", realm=" + quote(ch.realm);
        out += ", nonce=" + quote(ch.nonce);
        out += ", uri=" + quote(in.uri);
        out += ", algorithm=";
        out += to_string(ch.algorithm);
        out += ", response=" + quote(response.value());
        if (ch.has_opaque) out += ", opaque=" + quote(ch.opaque);
        if (!in.qop.empty()) {
            out += ", qop=" + in.qop;
            out += ", nc=" + nc_hex(in.nonce_count);
            out += ", cnonce=" + quote(in.cnonce);
        }
        return Result<std::string>::ok(std::move(out));
    }

    // ---- DigestAuthMiddleware ----

    DigestAuthMiddleware::DigestAuthMiddleware(std::string username,
                                               std::string password)
        : DigestAuthMiddleware(std::move(username), std::move(password),
                               &random_cnonce) {}

    DigestAuthMiddleware::DigestAuthMiddleware(std::string username,
                                               std::string password,
                                               CnonceGenerator cnonce)
        : username_(std::move(username)),
          password_(std::move(password)),
          cnonce_(cnonce ? std::move(cnonce) : CnonceGenerator(&random_cnonce)) {}

    void DigestAuthMiddleware::remember_(const std::string& origin,
                                         DigestChallenge challenge) {
        std::lock_guard<std::mutex> lk(mu_);
        const std::string realm = challenge.realm;
        Space& space = spaces_[SpaceKey{origin, realm}];
        if (space.challenge.nonce != challenge.nonce) space.nonce_count = 0;
        space.challenge = std::move(challenge);
        realm_by_origin_[origin] = realm;
    }

    Result<std::optional<std::string>> DigestAuthMiddleware::authorize_(
        const std::string& origin, const std::string& uri, const Request& req) {
        using R = Result<std::optional<std::string>>;

        std::lock_guard<std::mutex> lk(mu_);
        auto rit = realm_by_origin_.find(origin);
        if (rit == realm_by_origin_.end()) return R::ok(std::nullopt);
        auto sit = spaces_.find(SpaceKey{origin, rit->second});
        if (sit == spaces_.end()) return R::ok(std::nullopt);
        Space& space = sit->second;

        if (!in_protection_space(space.challenge, origin, uri)) {
            return R::ok(std::nullopt);
        }
        auto qop = choose_qop(space.challenge, req.replayable());
        if (!qop) return R::ok(std::nullopt);

        DigestInput in;
        in.username = username_;
        in.password = password_;
        in.method = std::string(to_string(req.method));
        in.uri = uri;
        in.qop = *qop;
        if (!in.qop.empty() || is_sess(space.challenge.algorithm)) {
            in.cnonce = cnonce_();
            if (in.cnonce.empty()) {
                return R::err(Error{Error::Code::AuthChallenge,
                                    "could not generate a client nonce"});
            }
        }
        if (req.body) in.body = *req.body;
        in.nonce_count = space.nonce_count + 1;

        auto header = build_digest_authorization(space.challenge, in);
        if (!header) return std::move(header).forward_error<std::optional<std::string>>();
        space.nonce_count = in.nonce_count;
        space.qop = in.qop;
        return R::ok(std::move(header).value());
    }

    std::optional<DigestAuthMiddleware::Snapshot> DigestAuthMiddleware::context(
        std::string_view origin, std::string_view realm) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = spaces_.find(SpaceKey{std::string(origin), std::string(realm)});
        if (it == spaces_.end()) return std::nullopt;
        return Snapshot{it->second.challenge.nonce, it->second.nonce_count,
                        it->second.qop, it->second.challenge.algorithm};
    }

    boost::asio::awaitable<Result<Response>> DigestAuthMiddleware::handle(
        Request& req, Next next) {
        using R = Result<Response>;

        auto url = parse_url(req.url);
        // Caller-supplied credentials and unparseable URLs pass through.
        if (!url || req.header("Authorization")) co_return co_await next(req);

        const std::string origin = origin_of(url.value());
        const std::string uri = url.value().target;

        auto preemptive = authorize_(origin, uri, req);
        if (!preemptive) co_return std::move(preemptive).forward_error<Response>();
        if (preemptive.value()) req.set_header("Authorization", *preemptive.value());

        auto res = co_await next(req);
        if (!res || res.value().status_code != 401) co_return std::move(res);

        auto challenge_value = find_digest_challenge(res.value().headers);
        if (!challenge_value) co_return std::move(res);

        auto challenge = parse_digest_challenge(*challenge_value);
        if (!challenge) {
            Error e = std::move(challenge).error();
            e.endpoint = origin;
            co_return R::err(std::move(e));
        }
        const std::string realm = challenge.value().realm;
        remember_(origin, std::move(challenge).value());

        if (!req.replayable()) co_return std::move(res);

        auto retry = authorize_(origin, uri, req);
        if (!retry) co_return std::move(retry).forward_error<Response>();
        if (!retry.value()) co_return std::move(res);

        log::logger()->debug("answering Digest challenge for realm \"{}\" at {}",
                             realm, origin);
        req.set_header("Authorization", *retry.value());
        co_return co_await next(req);
    }

}  // namespace wireline
