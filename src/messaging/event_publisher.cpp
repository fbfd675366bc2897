#include "messaging/event_publisher.hpp"
#include "messaging/payload_codec.hpp"
#include "utils/logger.hpp"

namespace wordbase {

EventPublisher::EventPublisher(MessageBroker& broker, std::string queue)
    : broker_(broker), queue_(std::move(queue)) {
}

void EventPublisher::publishUser(const User& user) {
    publish(Purpose::AddUser, encodeUser(user));
}

void EventPublisher::publishProfile(const Profile& profile) {
    publish(Purpose::AddProfile, encodeProfile(profile));
}

void EventPublisher::publishLocation(const Location& location) {
    publish(Purpose::AddLocation, encodeLocation(location));
}

void EventPublisher::publishWord(const NewWord& word) {
    publish(Purpose::AddWord, encodeWord(word));
}

void EventPublisher::publishPayment(const Payment& payment) {
    publish(Purpose::CreatePayment, encodePayment(payment));
}

void EventPublisher::publish(Purpose purpose, const std::string& payload_json) {
    broker_.publish(queue_, encodeEnvelope(purposeToString(purpose), payloadKey(purpose), payload_json));
    Logger::getInstance().debug(std::string("Published ") + purposeToString(purpose) + " to " + queue_);
}

} // namespace wordbase
