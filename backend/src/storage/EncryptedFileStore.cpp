#include "EncryptedFileStore.hpp"
#include "../core/Errors.hpp"
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "FGDATA1\n";

/* -------------------------
   Plain-text document
   -------------------------
   One record per block, blocks end with "---". Text fields are escaped so
   every value occupies exactly one line; lists are a count line followed by
   one line per entry.
*/

static std::string escapeText(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\\') out += "\\\\";
        else if (c == '\n') out += "\\n";
        else if (c == '\r') out += "\\r";
        else out += c;
    }
    return out;
}

static std::string unescapeText(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 == s.size()) {
            out += s[i];
            continue;
        }
        char n = s[++i];
        if (n == 'n') out += '\n';
        else if (n == 'r') out += '\r';
        else out += n;
    }
    return out;
}

static void writeText(std::ostream& out, const std::string& s) {
    out << escapeText(s) << "\n";
}

static void writeOptional(std::ostream& out, const std::optional<std::string>& v) {
    if (v) {
        out << "1\n";
        writeText(out, *v);
    }
    else {
        out << "0\n";
    }
}

template <typename List>
static void writeList(std::ostream& out, const List& list) {
    out << list.size() << "\n";
    for (const auto& s : list) writeText(out, s);
}

class LineReader {
public:
    explicit LineReader(const std::string& plain) : in(plain) {}

    bool atEnd() {
        return in.peek() == std::char_traits<char>::eof();
    }

    std::string line() {
        std::string l;
        if (!std::getline(in, l)) {
            throw StoreUnavailable("data file truncated");
        }
        return l;
    }

    std::string text() { return unescapeText(line()); }

    long long number() {
        std::string l = line();
        try {
            size_t used = 0;
            long long v = std::stoll(l, &used);
            if (used != l.size()) throw std::invalid_argument(l);
            return v;
        }
        catch (const std::exception&) {
            throw StoreUnavailable("data file corrupt: expected a number, got '" + l + "'");
        }
    }

    std::optional<std::string> optional() {
        if (number() == 0) return std::nullopt;
        return text();
    }

    template <typename List>
    void list(List& out) {
        long long n = number();
        if (n < 0) throw StoreUnavailable("data file corrupt: negative list size");
        out.clear();
        for (long long i = 0; i < n; ++i) out.push_back(text());
    }

    void expect(const std::string& token) {
        std::string l = line();
        if (l != token) {
            throw StoreUnavailable("data file corrupt: expected '" + token + "', got '" + l + "'");
        }
    }

private:
    std::istringstream in;
};

static void serializeCard(std::ostream& out, const Flashcard& c) {
    out << "card\n";
    writeText(out, c.id);
    writeText(out, c.owner_id);
    writeText(out, c.title);
    out << cardTypeName(c.type()) << "\n";

    switch (c.type()) {
    case CardType::TWO_SIDED: {
        const auto& body = std::get<TwoSidedContent>(c.content);
        writeText(out, body.front);
        writeText(out, body.back);
        break;
    }
    case CardType::FILL_IN_BLANK: {
        const auto& body = std::get<FillInBlankContent>(c.content);
        writeText(out, body.text_with_blanks);
        writeList(out, body.answers);
        out << (body.case_sensitive ? 1 : 0) << "\n";
        break;
    }
    case CardType::MULTIPLE_CHOICE: {
        const auto& body = std::get<MultipleChoiceContent>(c.content);
        writeText(out, body.question);
        writeList(out, body.options);
        out << body.correct_indices.size() << "\n";
        for (int idx : body.correct_indices) out << idx << "\n";
        out << (body.allow_multiple ? 1 : 0) << "\n";
        break;
    }
    }

    out << std::setprecision(17) << c.ease_factor << "\n"
        << c.interval_days << "\n"
        << c.repetitions << "\n"
        << static_cast<long long>(c.due_at) << "\n"
        << static_cast<long long>(c.last_reviewed_at) << "\n"
        << c.lapses << "\n"
        << (c.is_leech ? 1 : 0) << "\n"
        << static_cast<long long>(c.created_at) << "\n";
    writeList(out, c.tags);
    out << "---\n";
}

static Flashcard parseCard(LineReader& in) {
    Flashcard c;
    c.id = in.text();
    c.owner_id = in.text();
    c.title = in.text();

    CardType type;
    try {
        type = cardTypeFromName(in.line());
    }
    catch (const InvalidArgument& e) {
        throw StoreUnavailable(std::string("data file corrupt: ") + e.what());
    }

    switch (type) {
    case CardType::TWO_SIDED: {
        TwoSidedContent body;
        body.front = in.text();
        body.back = in.text();
        c.content = body;
        break;
    }
    case CardType::FILL_IN_BLANK: {
        FillInBlankContent body;
        body.text_with_blanks = in.text();
        in.list(body.answers);
        body.case_sensitive = in.number() != 0;
        c.content = body;
        break;
    }
    case CardType::MULTIPLE_CHOICE: {
        MultipleChoiceContent body;
        body.question = in.text();
        in.list(body.options);
        long long n = in.number();
        for (long long i = 0; i < n; ++i) body.correct_indices.push_back(static_cast<int>(in.number()));
        body.allow_multiple = in.number() != 0;
        c.content = body;
        break;
    }
    }

    std::string ease = in.line();
    try {
        c.ease_factor = std::stod(ease);
    }
    catch (const std::exception&) {
        throw StoreUnavailable("data file corrupt: bad ease factor '" + ease + "'");
    }
    c.interval_days = static_cast<int>(in.number());
    c.repetitions = static_cast<int>(in.number());
    c.due_at = static_cast<std::time_t>(in.number());
    c.last_reviewed_at = static_cast<std::time_t>(in.number());
    c.lapses = static_cast<int>(in.number());
    c.is_leech = in.number() != 0;
    c.created_at = static_cast<std::time_t>(in.number());
    in.list(c.tags);
    in.expect("---");
    return c;
}

static void serializeSession(std::ostream& out, const Session& s) {
    out << "session\n";
    writeText(out, s.owner_id);
    out << sessionModeName(s.mode) << "\n"
        << sessionModeName(s.prior_mode) << "\n";
    writeOptional(out, s.active_card_id);
    writeOptional(out, s.editing_card_id);
    writeList(out, s.queue);
    out << static_cast<long long>(s.started_at) << "\n"
        << s.stats.again << "\n"
        << s.stats.hard << "\n"
        << s.stats.good << "\n"
        << s.stats.easy << "\n";
    writeList(out, s.recent_submissions);
    out << "---\n";
}

static Session parseSession(LineReader& in) {
    Session s;
    s.owner_id = in.text();
    try {
        s.mode = sessionModeFromName(in.line());
        s.prior_mode = sessionModeFromName(in.line());
    }
    catch (const InvalidArgument& e) {
        throw StoreUnavailable(std::string("data file corrupt: ") + e.what());
    }
    s.active_card_id = in.optional();
    s.editing_card_id = in.optional();
    in.list(s.queue);
    s.started_at = static_cast<std::time_t>(in.number());
    s.stats.again = static_cast<int>(in.number());
    s.stats.hard = static_cast<int>(in.number());
    s.stats.good = static_cast<int>(in.number());
    s.stats.easy = static_cast<int>(in.number());
    in.list(s.recent_submissions);
    in.expect("---");
    return s;
}

/* -------------------------
   Encrypted file store
   ------------------------- */

EncryptedFileStore::EncryptedFileStore(const std::string& path, const std::vector<unsigned char>& k)
    : filename(path), key(k)
{
    if (sodium_init() < 0) {
        throw StoreUnavailable("failed to initialize libsodium");
    }
    if (key.size() != crypto_secretbox_KEYBYTES) {
        throw InvalidArgument("invalid key size");
    }
    load();
}

std::vector<unsigned char> EncryptedFileStore::loadOrCreateKey(const std::string& keyFile) {
    if (sodium_init() < 0) {
        throw StoreUnavailable("failed to initialize libsodium");
    }

    std::vector<unsigned char> key(crypto_secretbox_KEYBYTES);

    std::ifstream in(keyFile);
    if (in) {
        std::string hex;
        std::getline(in, hex);
        size_t binLen = 0;
        if (sodium_hex2bin(key.data(), key.size(), hex.c_str(), hex.size(),
                nullptr, &binLen, nullptr) != 0 || binLen != key.size()) {
            spdlog::error("Key file '{}' is malformed", keyFile);
            throw InvalidArgument("key file '" + keyFile + "' is malformed");
        }
        spdlog::info("Loaded store key from '{}'", keyFile);
        return key;
    }

    crypto_secretbox_keygen(key.data());

    std::vector<char> hex(key.size() * 2 + 1);
    sodium_bin2hex(hex.data(), hex.size(), key.data(), key.size());

    std::ofstream out(keyFile, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for writing the store key", keyFile);
        throw StoreUnavailable("cannot write key file '" + keyFile + "'");
    }

    // owner-only before any key material lands in the file
    std::error_code ec;
    std::filesystem::permissions(keyFile,
        std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
        std::filesystem::perm_options::replace, ec);
    if (ec) {
        spdlog::error("Failed to restrict permissions on '{}': {}", keyFile, ec.message());
        throw StoreUnavailable("cannot restrict key file '" + keyFile + "'");
    }

    out << hex.data() << "\n";
    if (!out) {
        throw StoreUnavailable("cannot write key file '" + keyFile + "'");
    }

    spdlog::info("Generated new store key in '{}'", keyFile);
    return key;
}

void EncryptedFileStore::load() {
    spdlog::info("Loading encrypted store from '{}'", filename);

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("Store file '{}' not found; treating as empty", filename);
        return;
    }

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != sizeof(hdr) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header in '{}'", filename);
        throw StoreUnavailable("invalid magic header in '" + filename + "'");
    }

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != sizeof(nonce)) {
        spdlog::error("Failed to read nonce");
        throw StoreUnavailable("failed to read nonce from '" + filename + "'");
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        throw StoreUnavailable("ciphertext too short in '" + filename + "'");
    }

    std::vector<unsigned char> plain(ciphertext.size() - crypto_secretbox_MACBYTES);
    if (crypto_secretbox_open_easy(plain.data(), ciphertext.data(), ciphertext.size(), nonce, key.data()) != 0) {
        spdlog::error("Decryption failed");
        throw StoreUnavailable("decryption of '" + filename + "' failed");
    }

    LineReader reader(std::string(reinterpret_cast<char*>(plain.data()), plain.size()));

    std::lock_guard<std::mutex> lock(mtx);
    while (!reader.atEnd()) {
        std::string kind = reader.line();
        if (kind == "card") {
            Flashcard c = parseCard(reader);
            state.cards[c.id] = std::move(c);
        }
        else if (kind == "session") {
            Session s = parseSession(reader);
            state.sessions[s.owner_id] = std::move(s);
        }
        else {
            throw StoreUnavailable("data file corrupt: unknown record '" + kind + "'");
        }
    }

    spdlog::info("Loaded {} cards and {} sessions", state.cards.size(), state.sessions.size());
}

void EncryptedFileStore::persist(const State& current) {
    std::ostringstream oss;
    for (const auto& p : current.cards) serializeCard(oss, p.second);
    for (const auto& p : current.sessions) serializeSession(oss, p.second);

    std::string plain = oss.str();
    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    if (crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.data()) != 0) {
        spdlog::error("Encryption failed");
        throw StoreUnavailable("encryption failed");
    }

    const std::string tmp = filename + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for encrypted write", tmp);
            throw StoreUnavailable("cannot open '" + tmp + "' for writing");
        }

        out.write(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
        out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
        out.write(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
        out.flush();
        if (!out) {
            spdlog::error("Short write to '{}'", tmp);
            std::remove(tmp.c_str());
            throw StoreUnavailable("write to '" + tmp + "' failed");
        }
    }

    if (std::rename(tmp.c_str(), filename.c_str()) != 0) {
        spdlog::error("Failed to move '{}' over '{}'", tmp, filename);
        std::remove(tmp.c_str());
        throw StoreUnavailable("cannot replace '" + filename + "'");
    }

    spdlog::info("Saved {} cards and {} sessions to '{}'",
        current.cards.size(), current.sessions.size(), filename);
}
