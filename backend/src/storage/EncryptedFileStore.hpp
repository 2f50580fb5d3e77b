#pragma once
#include <string>
#include <vector>
#include "MemoryStore.hpp"

// EncryptedFileStore keeps every card and session of every owner in memory
// and rewrites one encrypted file after each mutation.
//
// File format:
//   Header: 8 bytes ASCII "FGDATA1\n" (magic + version)
//   Nonce: crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes (secretbox of the line-based document)
//
// Writes go to "<path>.tmp" and are renamed over <path>, so a commitReview
// lands completely or not at all. A failed write restores the in-memory
// state and throws StoreUnavailable.
class EncryptedFileStore : public MemoryStore {
public:
    // Loads the existing file, if any. Throws StoreUnavailable when the file
    // cannot be read or decrypted, InvalidArgument on a bad key size.
    EncryptedFileStore(const std::string& path, const std::vector<unsigned char>& key);

    // Reads a hex-encoded secretbox key, generating and writing one if the
    // file does not exist yet.
    static std::vector<unsigned char> loadOrCreateKey(const std::string& keyFile);

protected:
    void persist(const State& current) override;

private:
    std::string filename;
    std::vector<unsigned char> key;

    void load();
};
