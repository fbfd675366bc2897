#ifndef WORDBASE_EVENT_PUBLISHER_HPP
#define WORDBASE_EVENT_PUBLISHER_HPP

#include <string>
#include "domain/models.hpp"
#include "messaging/envelope.hpp"
#include "messaging/message_broker.hpp"

namespace wordbase {

// Turns write intents into envelopes on the work queue
class EventPublisher {
public:
    EventPublisher(MessageBroker& broker, std::string queue);

    void publishUser(const User& user);
    void publishProfile(const Profile& profile);
    void publishLocation(const Location& location);
    void publishWord(const NewWord& word);
    void publishPayment(const Payment& payment);

    void publish(Purpose purpose, const std::string& payload_json);

    const std::string& queue() const { return queue_; }

private:
    MessageBroker& broker_;
    std::string queue_;
};

} // namespace wordbase

#endif // WORDBASE_EVENT_PUBLISHER_HPP
