#pragma once

#include "../types.hpp"
#include "history_store.hpp"
#include <memory>
#include <string>
#include <vector>

namespace owl {
namespace engine {

/**
 * @brief Per-user conversation log on top of a history store
 *
 * Thin facade: the store provides ordering, expiry and synchronisation.
 * user_messages() is what a turn sees of earlier exchanges; the full log
 * (assistant and tool messages included) is only returned by read().
 */
class ConversationSession {
public:
    explicit ConversationSession(std::shared_ptr<IHistoryStore> store)
        : store_(std::move(store))
    {}

    /// Append one message and refresh the user's expiry.
    Expected<void> add(const std::string& user_id, const Message& message) {
        return store_->append(user_id, std::vector<Message>{message});
    }

    /// Append a batch in order, in one store call.
    Expected<void> commit(const std::string& user_id, const std::vector<Message>& messages) {
        if (messages.empty()) {
            return {};
        }
        return store_->append(user_id, messages);
    }

    Expected<std::vector<Message>> read(const std::string& user_id) {
        return store_->read(user_id);
    }

    /// Copy of the user-role slice of the log, in order.
    Expected<std::vector<Message>> user_messages(const std::string& user_id) {
        auto all = store_->read(user_id);
        if (!all) {
            return tl::unexpected(all.error());
        }
        std::vector<Message> users;
        for (auto& message : *all) {
            if (message.role == Role::User) {
                users.push_back(std::move(message));
            }
        }
        return users;
    }

    Expected<void> clear(const std::string& user_id) {
        return store_->clear(user_id);
    }

    const IHistoryStore& store() const { return *store_; }

private:
    std::shared_ptr<IHistoryStore> store_;
};

} // namespace engine
} // namespace owl
