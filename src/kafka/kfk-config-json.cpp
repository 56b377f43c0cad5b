/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-config-json.cpp
 * @brief Mapping between the kfk config structs and their protobuf JSON
 *        schema.
 */

#include "kafka/kfk-config-json.hpp"

#include <google/protobuf/duration.pb.h>
#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>

#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

#include "proto/kfk-config.pb.h"

#include "kafka/kfk-config.hpp"
#include "kfk-debug.hpp"
#include "kfk-error.hpp"

namespace kfk {

namespace {

using google::protobuf::util::TimeUtil;

auto fromPb(const google::protobuf::Duration &duration)
    -> std::chrono::milliseconds {
  return std::chrono::milliseconds{TimeUtil::DurationToMilliseconds(duration)};
}

auto toPb(std::chrono::milliseconds duration) -> google::protobuf::Duration {
  return TimeUtil::MillisecondsToDuration(duration.count());
}

void fromPb(const pb::CredentialPb &credentialPb, Kfk_Credential &credential) {
  if (credentialPb.has_password()) {
    credential.password = credentialPb.password();
  }

  if (credentialPb.has_password_env_var()) {
    credential.passwordEnvVar = credentialPb.password_env_var();
  }

  if (credentialPb.has_password_file()) {
    credential.passwordFile = credentialPb.password_file();
  }
}

void toPb(const Kfk_Credential &credential, pb::CredentialPb *credentialPb) {
  if (!credential.passwordEnvVar.empty()) {
    credentialPb->set_password_env_var(credential.passwordEnvVar);
  }

  if (!credential.passwordFile.empty()) {
    credentialPb->set_password_file(credential.passwordFile);
  }
}

void fromPb(const pb::BaseConfigPb &basePb, Kfk_BaseConfig &config) {
  if (basePb.has_brokers()) {
    config.brokers = basePb.brokers();
  }

  if (basePb.has_client_id()) {
    config.clientId = basePb.client_id();
  }

  if (basePb.has_auth_type()) {
    config.authType = basePb.auth_type();
  }

  if (basePb.has_username()) {
    config.username = basePb.username();
  }

  if (basePb.has_credential()) {
    fromPb(basePb.credential(), config.credential);
  }

  if (basePb.has_dial_timeout()) {
    config.dialTimeout = fromPb(basePb.dial_timeout());
  }

  if (basePb.has_request_timeout()) {
    config.requestTimeout = fromPb(basePb.request_timeout());
  }

  if (basePb.has_retry_backoff()) {
    config.retryBackoff = fromPb(basePb.retry_backoff());
  }

  if (basePb.has_max_retries()) {
    config.maxRetries = basePb.max_retries();
  }

  if (basePb.has_tls()) {
    const auto &tlsPb = basePb.tls();
    Kfk_TlsConfig tls{};

    tls.enable = tlsPb.enable();
    tls.caFile = tlsPb.ca_file();
    tls.certFile = tlsPb.cert_file();
    tls.keyFile = tlsPb.key_file();
    fromPb(tlsPb.key_password(), tls.keyPassword);
    tls.insecureSkipVerify = tlsPb.insecure_skip_verify();

    config.tls = tls;
  }

  if (basePb.has_aws_region()) {
    config.awsRegion = basePb.aws_region();
  }

  if (basePb.has_aws_access_key()) {
    config.awsAccessKey = basePb.aws_access_key();
  }

  if (basePb.has_aws_secret()) {
    fromPb(basePb.aws_secret(), config.awsSecret);
  }

  if (basePb.has_oauth_token_url()) {
    config.oauthTokenUrl = basePb.oauth_token_url();
  }

  if (basePb.has_oauth_client_id()) {
    config.oauthClientId = basePb.oauth_client_id();
  }

  if (basePb.has_oauth_scope()) {
    config.oauthScope = basePb.oauth_scope();
  }

  if (basePb.has_oauth_secret()) {
    fromPb(basePb.oauth_secret(), config.oauthSecret);
  }
}

void toPb(const Kfk_BaseConfig &config, pb::BaseConfigPb *basePb) {
  basePb->set_brokers(config.brokers);
  basePb->set_client_id(config.clientId);
  basePb->set_auth_type(config.authType);
  basePb->set_username(config.username);
  toPb(config.credential, basePb->mutable_credential());
  *basePb->mutable_dial_timeout() = toPb(config.dialTimeout);
  *basePb->mutable_request_timeout() = toPb(config.requestTimeout);
  *basePb->mutable_retry_backoff() = toPb(config.retryBackoff);
  basePb->set_max_retries(config.maxRetries);

  if (config.tls) {
    auto *tlsPb = basePb->mutable_tls();

    tlsPb->set_enable(config.tls->enable);
    tlsPb->set_ca_file(config.tls->caFile);
    tlsPb->set_cert_file(config.tls->certFile);
    tlsPb->set_key_file(config.tls->keyFile);
    toPb(config.tls->keyPassword, tlsPb->mutable_key_password());
    tlsPb->set_insecure_skip_verify(config.tls->insecureSkipVerify);
  }

  if (!config.awsRegion.empty()) {
    basePb->set_aws_region(config.awsRegion);
    basePb->set_aws_access_key(config.awsAccessKey);
    toPb(config.awsSecret, basePb->mutable_aws_secret());
  }

  if (!config.oauthTokenUrl.empty()) {
    basePb->set_oauth_token_url(config.oauthTokenUrl);
    basePb->set_oauth_client_id(config.oauthClientId);
    basePb->set_oauth_scope(config.oauthScope);
    toPb(config.oauthSecret, basePb->mutable_oauth_secret());
  }
}

auto parseJson(std::string_view json, google::protobuf::Message &message)
    -> std::error_code {
  google::protobuf::util::JsonParseOptions options{};
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(
      std::string{json}, &message, options);
  if (!status.ok()) {
    KFK_DEBUG_PRINT(std::cerr << "config json: " << status.ToString() << '\n');

    return Kfk_Errc::kConfiguration;
  }

  return {};
}

auto printJson(const google::protobuf::Message &message)
    -> std::expected<std::string, std::error_code> {
  google::protobuf::util::JsonPrintOptions options{};
  options.add_whitespace = true;

  std::string json{};
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    KFK_DEBUG_PRINT(std::cerr << "config json: " << status.ToString() << '\n');

    return std::unexpected(make_error_code(Kfk_Errc::kConfiguration));
  }

  return json;
}

} // namespace

auto loadProducerConfigJson(std::string_view json)
    -> std::expected<Kfk_ProducerConfig, std::error_code> {
  pb::ProducerConfigPb configPb{};
  Kfk_ProducerConfig config{};

  if (auto ec = parseJson(json, configPb); ec) {
    return std::unexpected(ec);
  }

  fromPb(configPb.base(), config);

  if (configPb.has_default_topic()) {
    config.defaultTopic = configPb.default_topic();
  }

  if (configPb.has_transactional_id()) {
    config.transactionalId = configPb.transactional_id();
  }

  if (configPb.has_acks()) {
    config.acks = configPb.acks();
  }

  if (configPb.has_compression()) {
    config.compression = configPb.compression();
  }

  if (configPb.has_batch_max_records()) {
    config.batchMaxRecords = configPb.batch_max_records();
  }

  if (configPb.has_batch_max_bytes()) {
    config.batchMaxBytes = configPb.batch_max_bytes();
  }

  if (configPb.has_linger()) {
    config.linger = fromPb(configPb.linger());
  }

  if (configPb.has_idempotent()) {
    config.idempotent = configPb.idempotent();
  }

  return config;
}

auto loadConsumerConfigJson(std::string_view json)
    -> std::expected<Kfk_ConsumerConfig, std::error_code> {
  pb::ConsumerConfigPb configPb{};
  Kfk_ConsumerConfig config{};

  if (auto ec = parseJson(json, configPb); ec) {
    return std::unexpected(ec);
  }

  fromPb(configPb.base(), config);

  if (configPb.topics_size() > 0) {
    config.topics.assign(configPb.topics().begin(), configPb.topics().end());
  }

  if (configPb.has_group()) {
    config.group = configPb.group();
  }

  if (configPb.has_start_offset()) {
    config.startOffset = configPb.start_offset();
  }

  if (configPb.has_isolation_level()) {
    config.isolationLevel = configPb.isolation_level();
  }

  if (configPb.has_session_timeout()) {
    config.sessionTimeout = fromPb(configPb.session_timeout());
  }

  if (configPb.has_rebalance_timeout()) {
    config.rebalanceTimeout = fromPb(configPb.rebalance_timeout());
  }

  if (configPb.has_heartbeat_interval()) {
    config.heartbeatInterval = fromPb(configPb.heartbeat_interval());
  }

  if (configPb.has_auto_commit()) {
    config.autoCommit = configPb.auto_commit();
  }

  if (configPb.has_auto_commit_interval()) {
    config.autoCommitInterval = fromPb(configPb.auto_commit_interval());
  }

  if (configPb.has_fetch_min_bytes()) {
    config.fetchMinBytes = configPb.fetch_min_bytes();
  }

  if (configPb.has_fetch_max_bytes()) {
    config.fetchMaxBytes = configPb.fetch_max_bytes();
  }

  if (configPb.has_fetch_max_wait()) {
    config.fetchMaxWait = fromPb(configPb.fetch_max_wait());
  }

  return config;
}

auto loadAdminConfigJson(std::string_view json)
    -> std::expected<Kfk_AdminConfig, std::error_code> {
  pb::AdminConfigPb configPb{};
  Kfk_AdminConfig config{};

  if (auto ec = parseJson(json, configPb); ec) {
    return std::unexpected(ec);
  }

  fromPb(configPb.base(), config);

  return config;
}

auto dumpConfigJson(const Kfk_ProducerConfig &config)
    -> std::expected<std::string, std::error_code> {
  pb::ProducerConfigPb configPb{};

  toPb(config, configPb.mutable_base());
  configPb.set_default_topic(config.defaultTopic);
  configPb.set_transactional_id(config.transactionalId);
  configPb.set_acks(config.acks);
  configPb.set_compression(config.compression);
  configPb.set_batch_max_records(config.batchMaxRecords);
  configPb.set_batch_max_bytes(config.batchMaxBytes);
  *configPb.mutable_linger() = toPb(config.linger);
  configPb.set_idempotent(config.idempotent);

  return printJson(configPb);
}

auto dumpConfigJson(const Kfk_ConsumerConfig &config)
    -> std::expected<std::string, std::error_code> {
  pb::ConsumerConfigPb configPb{};

  toPb(config, configPb.mutable_base());

  for (const auto &topic : config.topics) {
    configPb.add_topics(topic);
  }

  configPb.set_group(config.group);
  configPb.set_start_offset(config.startOffset);
  configPb.set_isolation_level(config.isolationLevel);
  *configPb.mutable_session_timeout() = toPb(config.sessionTimeout);
  *configPb.mutable_rebalance_timeout() = toPb(config.rebalanceTimeout);
  *configPb.mutable_heartbeat_interval() = toPb(config.heartbeatInterval);
  configPb.set_auto_commit(config.autoCommit);
  *configPb.mutable_auto_commit_interval() = toPb(config.autoCommitInterval);
  configPb.set_fetch_min_bytes(config.fetchMinBytes);
  configPb.set_fetch_max_bytes(config.fetchMaxBytes);
  *configPb.mutable_fetch_max_wait() = toPb(config.fetchMaxWait);

  return printJson(configPb);
}

auto dumpConfigJson(const Kfk_AdminConfig &config)
    -> std::expected<std::string, std::error_code> {
  pb::AdminConfigPb configPb{};

  toPb(config, configPb.mutable_base());

  return printJson(configPb);
}

} // namespace kfk
