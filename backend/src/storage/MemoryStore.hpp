#pragma once
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include "SessionStore.hpp"

// In-process store. Thread-safe; used directly for embedding and tests and
// as the working set of EncryptedFileStore.
class MemoryStore : public SessionStore {
public:
    MemoryStore() = default;

    std::optional<Session> loadSession(const std::string& owner) override;
    void saveSession(const Session& session) override;
    void deleteSession(const std::string& owner) override;

    std::optional<Flashcard> loadCard(const std::string& id) override;
    void saveCard(const Flashcard& card) override;
    bool deleteCard(const std::string& id) override;

    std::vector<Flashcard> queryDue(const std::string& owner, std::time_t now) override;
    std::vector<Flashcard> listCards(const std::string& owner) override;

    void commitReview(const Flashcard& card, const Session& session) override;

    size_t cardCount() const;
    size_t sessionCount() const;

protected:
    struct State {
        std::map<std::string, Flashcard> cards;          // by id, ordered for stable output
        std::unordered_map<std::string, Session> sessions; // by owner
    };

    // Hook run with the lock held after every mutation. Throwing
    // StoreUnavailable from it rolls the mutation back.
    virtual void persist(const State& current);

    mutable std::mutex mtx;
    State state;

private:
    template <typename Fn>
    void mutate(Fn&& fn);
};
