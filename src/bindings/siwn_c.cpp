#include "siwn/siwn_c.h"
#include "../protocol/siwn.hpp"
#include "../protocol/domain.hpp"
#include "../crypto/address.hpp"
#include "../crypto/signature.hpp"
#include "../helpers.hpp"

#include <chrono>
#include <cstring>
#include <memory>
#include <new>
#include <optional>
#include <string>

using namespace protocol;

/*==============================================================================
 * Internal wrapper structs for opaque handles
 *============================================================================*/

struct siwn_message_t {
    SiwnMessage msg;
};

/*==============================================================================
 * Helper functions
 *============================================================================*/

static char* copy_to_c_string(const std::string& str) {
    char* result = new char[str.size() + 1];
    std::memcpy(result, str.c_str(), str.size() + 1);
    return result;
}

static int get_string_field(const siwn_message_t* m, const std::string SiwnMessage::*field, char** out) {
    if (!m || !out) return SIWN_ERR_INVALID_ARG;
    try {
        *out = copy_to_c_string(m->msg.*field);
        return SIWN_OK;
    } catch (const std::bad_alloc&) {
        return SIWN_ERR_ALLOC;
    }
}

/*==============================================================================
 * Init / Utilities
 *============================================================================*/

int siwn_init(void) {
    try {
        siwn::utils::ensure_sodium_init();
        return SIWN_OK;
    } catch (const std::exception& e) {
        siwn::utils::logger()->error("siwn_init: {}", e.what());
        return SIWN_ERR;
    }
}

void siwn_free_string(char* str) {
    delete[] str;
}

/*==============================================================================
 * Address / signature API
 *============================================================================*/

int siwn_address_from_public_key(const char* public_key_hex, char** out) {
    if (!public_key_hex || !out) return SIWN_ERR_INVALID_ARG;

    try {
        *out = copy_to_c_string(neo::address_from_public_key(public_key_hex));
        return SIWN_OK;
    } catch (const AuthError&) {
        return SIWN_ERR_PARSE;
    } catch (const std::bad_alloc&) {
        return SIWN_ERR_ALLOC;
    } catch (const std::exception&) {
        return SIWN_ERR;
    }
}

int siwn_verify_signature(const char* message,
                          const char* signature_hex,
                          const char* public_key_hex) {
    if (!message || !signature_hex || !public_key_hex) return SIWN_ERR_INVALID_ARG;
    return neo::verify_signature(message, signature_hex, public_key_hex) ? SIWN_OK : SIWN_ERR_VERIFY_FAIL;
}

int siwn_sign_message(const char* message, const char* private_key_hex, char** out) {
    if (!message || !private_key_hex || !out) return SIWN_ERR_INVALID_ARG;

    try {
        *out = copy_to_c_string(neo::sign_message(message, private_key_hex));
        return SIWN_OK;
    } catch (const std::invalid_argument&) {
        return SIWN_ERR_PARSE;
    } catch (const p256::P256Error&) {
        return SIWN_ERR_PARSE;
    } catch (const std::bad_alloc&) {
        return SIWN_ERR_ALLOC;
    } catch (const std::exception&) {
        return SIWN_ERR;
    }
}

int siwn_is_domain_allowed(const char* domain, const char* patterns_csv) {
    if (!domain || !patterns_csv) return SIWN_ERR_INVALID_ARG;
    try {
        return is_domain_allowed(domain, parse_domain_patterns(patterns_csv)) ? 1 : 0;
    } catch (const std::bad_alloc&) {
        return SIWN_ERR_ALLOC;
    }
}

/*==============================================================================
 * Message API
 *============================================================================*/

int siwn_message_parse(const char* text, siwn_message_t** out) {
    if (!text || !out) return SIWN_ERR_INVALID_ARG;

    try {
        auto m = std::make_unique<siwn_message_t>();
        m->msg = SiwnMessage::parse(text);
        *out = m.release();
        return SIWN_OK;
    } catch (const AuthError&) {
        return SIWN_ERR_PARSE;
    } catch (const std::bad_alloc&) {
        return SIWN_ERR_ALLOC;
    } catch (const std::exception&) {
        return SIWN_ERR;
    }
}

int siwn_message_create(const char* domain,
                        const char* address,
                        const char* statement,
                        const char* uri,
                        const char* version,
                        int64_t chain_id,
                        const char* nonce,
                        const char* issued_at,
                        const char* expiration_time,
                        siwn_message_t** out) {
    if (!domain || !address || !statement || !uri || !version ||
        !nonce || !issued_at || !out) {
        return SIWN_ERR_INVALID_ARG;
    }

    try {
        auto m = std::make_unique<siwn_message_t>();
        m->msg.domain = domain;
        m->msg.address = address;
        m->msg.statement = statement;
        m->msg.uri = uri;
        m->msg.version = version;
        m->msg.chain_id = chain_id;
        m->msg.nonce = nonce;
        m->msg.issued_at = issued_at;
        if (expiration_time) m->msg.expiration_time = std::string(expiration_time);
        *out = m.release();
        return SIWN_OK;
    } catch (const std::bad_alloc&) {
        return SIWN_ERR_ALLOC;
    }
}

void siwn_message_destroy(siwn_message_t* msg) {
    delete msg;
}

int siwn_message_prepare(const siwn_message_t* msg, char** out) {
    if (!msg || !out) return SIWN_ERR_INVALID_ARG;

    try {
        *out = copy_to_c_string(msg->msg.prepare());
        return SIWN_OK;
    } catch (const std::bad_alloc&) {
        return SIWN_ERR_ALLOC;
    }
}

int siwn_message_validate(const siwn_message_t* msg,
                          int64_t now_unix_ms,
                          const char* expected_domain,
                          const char* expected_nonce,
                          char** reason) {
    if (!msg) return SIWN_ERR_INVALID_ARG;
    if (reason) *reason = nullptr;

    TimePoint now{std::chrono::milliseconds(now_unix_ms)};

    try {
        std::optional<std::string> domain;
        std::optional<std::string> nonce;
        if (expected_domain) domain = std::string(expected_domain);
        if (expected_nonce) nonce = std::string(expected_nonce);

        try {
            msg->msg.validate(now, domain, nonce);
            return SIWN_OK;
        } catch (const AuthError& e) {
            if (reason) *reason = copy_to_c_string(to_string(e.kind()));
            return SIWN_ERR_PROTOCOL;
        }
    } catch (const std::bad_alloc&) {
        return SIWN_ERR_ALLOC;
    }
}

int siwn_message_get_domain(const siwn_message_t* msg, char** out) {
    return get_string_field(msg, &SiwnMessage::domain, out);
}

int siwn_message_get_address(const siwn_message_t* msg, char** out) {
    return get_string_field(msg, &SiwnMessage::address, out);
}

int siwn_message_get_statement(const siwn_message_t* msg, char** out) {
    return get_string_field(msg, &SiwnMessage::statement, out);
}

int siwn_message_get_uri(const siwn_message_t* msg, char** out) {
    return get_string_field(msg, &SiwnMessage::uri, out);
}

int siwn_message_get_version(const siwn_message_t* msg, char** out) {
    return get_string_field(msg, &SiwnMessage::version, out);
}

int siwn_message_get_chain_id(const siwn_message_t* msg, int64_t* out) {
    if (!msg || !out) return SIWN_ERR_INVALID_ARG;
    *out = msg->msg.chain_id;
    return SIWN_OK;
}

int siwn_message_get_nonce(const siwn_message_t* msg, char** out) {
    return get_string_field(msg, &SiwnMessage::nonce, out);
}

int siwn_message_get_issued_at(const siwn_message_t* msg, char** out) {
    return get_string_field(msg, &SiwnMessage::issued_at, out);
}

int siwn_message_get_expiration_time(const siwn_message_t* msg, char** out) {
    if (!msg || !out) return SIWN_ERR_INVALID_ARG;
    try {
        *out = msg->msg.expiration_time ? copy_to_c_string(*msg->msg.expiration_time) : nullptr;
        return SIWN_OK;
    } catch (const std::bad_alloc&) {
        return SIWN_ERR_ALLOC;
    }
}
