/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk.hpp
 * @brief Convenience umbrella header for the kfk Kafka client facade.
 *
 * It pulls in the full public API (producer, transaction, consumer, admin,
 * their configuration and message model, and the context, logging and
 * threading helpers they use). Prefer the individual headers in translation
 * units that only need part of it.
 */

#ifndef KFK_HPP_

#define KFK_HPP_

#include "kfk-async.hpp"
#include "kfk-buffer.hpp"
#include "kfk-context.hpp"
#include "kfk-debug.hpp"
#include "kfk-error.hpp"
#include "kfk-log.hpp"
#include "kfk-proc.hpp"
#include "kfk-util.hpp"

#include "kafka/kfk-admin.hpp"
#include "kafka/kfk-client.hpp"
#include "kafka/kfk-config-json.hpp"
#include "kafka/kfk-config.hpp"
#include "kafka/kfk-consumer.hpp"
#include "kafka/kfk-kafka-log.hpp"
#include "kafka/kfk-kafka-util.hpp"
#include "kafka/kfk-message.hpp"
#include "kafka/kfk-producer.hpp"
#include "kafka/kfk-transaction.hpp"

#endif // KFK_HPP_
