#pragma once
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#include "tally/config.h"
#include "tally/errors.h"
#include "tally/instructions.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /* ------------------------------------------------------------------------- */
  /* Basic typedefs                                                            */
  /* ------------------------------------------------------------------------- */

  /** 8-bit unsigned integer used for wire bytes. */
  typedef uint8_t tally_u8;
  /** 32-bit unsigned integer (amounts and the counter value). */
  typedef uint32_t tally_u32;
  /** 64-bit unsigned integer (lengths, lamports, exit codes). */
  typedef uint64_t tally_u64;
  /** Error code type. 0 = OK, negative = error. */
  typedef int tally_err;

/** Size of an encoded instruction: discriminant + u32 amount. */
#define TALLY_INSTRUCTION_SIZE 5
/** Size of the encoded counter record. */
#define TALLY_STATE_SIZE 4
/** Size of a public key. */
#define TALLY_PUBKEY_SIZE 32
/** dup_info value marking an account entry that is not a duplicate. */
#define TALLY_NON_DUP_MARKER 0xFF

  /* ------------------------------------------------------------------------- */
  /* Accounts                                                                  */
  /* ------------------------------------------------------------------------- */

  /** Opaque 32-byte public key. */
  typedef struct TallyPubkey
  {
    tally_u8 x[TALLY_PUBKEY_SIZE];
  } TallyPubkey;

  /**
   * @brief Handle to one account passed in by the host.
   *
   * All pointers refer to host-owned memory (normally the entrypoint input
   * buffer) and stay valid for the duration of the invocation.
   *
   * Data access goes through the borrow functions below. A duplicate entry
   * points at the account it duplicates through dup_of so both share one
   * borrow state.
   */
  typedef struct TallyAccountInfo
  {
    const TallyPubkey *key;          /**< Account address */
    const TallyPubkey *owner;        /**< Owning program */
    tally_u64 *lamports;             /**< Balance (host-owned) */
    tally_u8 *data;                  /**< Account data */
    tally_u64 data_len;              /**< Length of data in bytes */
    tally_u64 rent_epoch;            /**< Next epoch rent is due */
    bool is_signer;                  /**< Signed the transaction */
    bool is_writable;                /**< Writable in this transaction */
    bool executable;                 /**< Holds a loaded program */
    int32_t borrow_state;            /**< 0 free, >0 shared borrows, -1 exclusive */
    struct TallyAccountInfo *dup_of; /**< Account this entry duplicates (or NULL) */
  } TallyAccountInfo;

  /**
   * @brief Borrow account data for reading.
   *
   * Fails with AccountBorrowFailed while the data is borrowed exclusively.
   * Every successful call must be paired with tally_account_release_data().
   *
   * @param acc       Account handle.
   * @param out_data  Receives the data pointer.
   * @param out_len   Receives the data length.
   * @return 0 on success, negative error code otherwise.
   */
  tally_err tally_account_borrow_data(TallyAccountInfo *acc, const tally_u8 **out_data,
                                      tally_u64 *out_len);

  /**
   * @brief Borrow account data for writing.
   *
   * Fails with AccountBorrowFailed while any borrow is active.
   * Every successful call must be paired with tally_account_release_data_mut().
   */
  tally_err tally_account_borrow_data_mut(TallyAccountInfo *acc, tally_u8 **out_data,
                                          tally_u64 *out_len);

  /** @brief Release one shared borrow. */
  tally_err tally_account_release_data(TallyAccountInfo *acc);

  /** @brief Release the exclusive borrow. */
  tally_err tally_account_release_data_mut(TallyAccountInfo *acc);

  /**
   * @brief Take the next account handle from an account list.
   *
   * @param accounts  Account array (may be NULL when count is 0).
   * @param count     Number of entries in accounts.
   * @param cursor    In/out position, start at 0.
   * @param out       Receives the account handle.
   * @return 0 on success, MissingAccount when the list is exhausted.
   */
  tally_err tally_next_account(TallyAccountInfo *accounts, tally_u64 count,
                               tally_u64 *cursor, TallyAccountInfo **out);

  /* ------------------------------------------------------------------------- */
  /* Wire records                                                              */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Decoded instruction.
   *
   * Layout on the wire: tag (1 byte), amount (u32 little-endian).
   */
  typedef struct TallyInstruction
  {
    tally_u8 tag;     /**< tally_insn_t discriminant */
    tally_u32 amount; /**< Operand */
  } TallyInstruction;

  /**
   * @brief Persisted counter record.
   *
   * Layout in account data: count (u32 little-endian), nothing else.
   */
  typedef struct TallyCounterState
  {
    tally_u32 count;
  } TallyCounterState;

  /**
   * @brief Decode instruction bytes.
   * @return 0 on success, MalformedInstruction if len != 5 or the tag is unknown.
   */
  tally_err tally_instruction_decode(const tally_u8 *data, tally_u64 len,
                                     TallyInstruction *out);

  /**
   * @brief Encode an instruction into exactly TALLY_INSTRUCTION_SIZE bytes.
   * @return 0 on success, BufferTooSmall if cap < 5, InvalidArg on unknown tag.
   */
  tally_err tally_instruction_encode(const TallyInstruction *insn, tally_u8 *out,
                                     tally_u64 cap);

  /**
   * @brief Decode the counter record.
   * @return 0 on success, MalformedState if len != 4.
   */
  tally_err tally_state_decode(const tally_u8 *data, tally_u64 len, TallyCounterState *out);

  /**
   * @brief Encode the counter record into exactly TALLY_STATE_SIZE bytes.
   * @return 0 on success, BufferTooSmall if cap < 4.
   */
  tally_err tally_state_encode(const TallyCounterState *state, tally_u8 *out,
                               tally_u64 cap);

  /* ------------------------------------------------------------------------- */
  /* Instruction handler                                                       */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Apply one instruction to the counter held by the first account.
   *
   * Reads the counter, adds or subtracts the amount without any overflow
   * check, writes the record back in place and logs the new value.
   *
   * @param program_id   Id of this program (unused by the handler).
   * @param accounts     Account list; only the first entry is touched.
   * @param count        Number of accounts.
   * @param data         Instruction bytes.
   * @param data_len     Instruction length.
   * @return 0 on success, negative error code otherwise. Nothing is written
   *         on failure.
   */
  tally_err tally_process_instruction(const TallyPubkey *program_id,
                                      TallyAccountInfo *accounts, tally_u64 count,
                                      const tally_u8 *data, tally_u64 data_len);

  /* ------------------------------------------------------------------------- */
  /* Entrypoint                                                                */
  /* ------------------------------------------------------------------------- */

  /** Parameters decoded from the loader's serialized input buffer. */
  typedef struct TallyInput
  {
    const TallyPubkey *program_id;
    TallyAccountInfo accounts[TALLY_MAX_ACCOUNTS];
    tally_u64 account_count;
    const tally_u8 *data;
    tally_u64 data_len;
  } TallyInput;

  /**
   * @brief Decode the loader's serialized input buffer.
   *
   * Account data, keys and the instruction bytes are not copied: the
   * returned handles point into buf.
   *
   * @param buf  Input buffer as laid out by the loader. Must be 8-byte
   *             aligned: lamports are handed out as tally_u64 pointers.
   * @param len  Length of buf.
   * @param out  Receives the decoded parameters.
   * @return 0 on success, MalformedInput on a misaligned buffer, truncation,
   *         a bad duplicate index or more than TALLY_MAX_ACCOUNTS accounts.
   */
  tally_err tally_deserialize_input(tally_u8 *buf, tally_u64 len, TallyInput *out);

  /**
   * @brief Run one invocation from a serialized input buffer.
   *
   * Failures are reported through tally_panic().
   *
   * @return 0 on success, host exit code (see tally_err_exit_code) otherwise.
   */
  tally_u64 tally_entrypoint(tally_u8 *buf, tally_u64 len);

#ifdef __cplusplus
}
#endif
