#ifndef SIWN_C_H
#define SIWN_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/*==============================================================================
 * Status codes
 *============================================================================*/
#define SIWN_OK                0
#define SIWN_ERR              -1
#define SIWN_ERR_INVALID_ARG  -2
#define SIWN_ERR_VERIFY_FAIL  -3
#define SIWN_ERR_ALLOC        -4
#define SIWN_ERR_PARSE        -5
#define SIWN_ERR_PROTOCOL     -6

/*==============================================================================
 * Sizes (hex characters, excluding the terminating NUL)
 *============================================================================*/
#define SIWN_PUBLIC_KEY_HEX_LEN   66
#define SIWN_SIGNATURE_HEX_LEN   128
#define SIWN_ADDRESS_LEN          34

/*==============================================================================
 * Opaque handles
 *============================================================================*/
typedef struct siwn_message_t siwn_message_t;

/*==============================================================================
 * Init / Utilities
 *============================================================================*/

/** Initialize the library. Call once at process start. */
int siwn_init(void);

/** Free a heap-allocated string returned by siwn_* functions. */
void siwn_free_string(char* str);

/*==============================================================================
 * Address / signature API
 *============================================================================*/

/**
 * Derive the Neo N3 address of a hex-encoded secp256r1 public key.
 * Returns SIWN_OK and writes a new string to *out, or SIWN_ERR_PARSE if the
 * key is malformed or not on the curve.
 */
int siwn_address_from_public_key(const char* public_key_hex, char** out);

/**
 * Verify a NeoLine signMessageWithoutSaltV2 signature over `message`.
 * Returns SIWN_OK if valid, SIWN_ERR_VERIFY_FAIL otherwise.
 */
int siwn_verify_signature(const char* message,
                          const char* signature_hex,
                          const char* public_key_hex);

/** Sign `message` the way the wallet does. Writes the hex r || s to *out. */
int siwn_sign_message(const char* message, const char* private_key_hex, char** out);

/**
 * Check a domain against a comma-separated pattern list.
 * Returns 1 if allowed, 0 if not, SIWN_ERR_INVALID_ARG on NULL input.
 */
int siwn_is_domain_allowed(const char* domain, const char* patterns_csv);

/*==============================================================================
 * Message API
 *============================================================================*/

/** Parse challenge text. Returns SIWN_ERR_PARSE if it is not a SIWN message. */
int siwn_message_parse(const char* text, siwn_message_t** out);

/** Build a message from fields. expiration_time may be NULL. */
int siwn_message_create(const char* domain,
                        const char* address,
                        const char* statement,
                        const char* uri,
                        const char* version,
                        int64_t chain_id,
                        const char* nonce,
                        const char* issued_at,
                        const char* expiration_time,
                        siwn_message_t** out);

void siwn_message_destroy(siwn_message_t* msg);

/** Render the text a wallet signs. */
int siwn_message_prepare(const siwn_message_t* msg, char** out);

/**
 * Validate at `now_unix_ms`. expected_domain / expected_nonce may be NULL.
 * Returns SIWN_OK, or SIWN_ERR_PROTOCOL with the failure kind name
 * (e.g. "MessageExpired") written to *reason when reason is not NULL.
 */
int siwn_message_validate(const siwn_message_t* msg,
                          int64_t now_unix_ms,
                          const char* expected_domain,
                          const char* expected_nonce,
                          char** reason);

/* Field accessors. Strings are newly allocated; free with siwn_free_string. */
int siwn_message_get_domain(const siwn_message_t* msg, char** out);
int siwn_message_get_address(const siwn_message_t* msg, char** out);
int siwn_message_get_statement(const siwn_message_t* msg, char** out);
int siwn_message_get_uri(const siwn_message_t* msg, char** out);
int siwn_message_get_version(const siwn_message_t* msg, char** out);
int siwn_message_get_chain_id(const siwn_message_t* msg, int64_t* out);
int siwn_message_get_nonce(const siwn_message_t* msg, char** out);
int siwn_message_get_issued_at(const siwn_message_t* msg, char** out);

/** Writes NULL to *out when the message carries no expiration time. */
int siwn_message_get_expiration_time(const siwn_message_t* msg, char** out);

#ifdef __cplusplus
}
#endif

#endif /* SIWN_C_H */
