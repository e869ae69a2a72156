#pragma once

#include <metabolites.h>
#include <cstdint>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include <zmq.hpp>

// https://github.com/zeromq/cppzmq

// Flat binary frame: magic byte, then (name, dtype, payload) fields.  Ints and doubles are host byte order.
class MessageWrapper
{
public:
  MessageWrapper() { data_.push_back(13); }  // magic number
  operator zmq::message_t () const { return zmq::message_t(data_.begin(), data_.end()); }
  size_t size() const { return data_.size(); }
  const std::vector<uint8_t>& data() const { return data_; }

  void addField(const std::string& name, double val);
  void addField(const std::string& name, const Eigen::ArrayXd& arr);
  void addField(const std::string& name, const std::vector<std::string>& strings);
  // <prefix>_names and <prefix>_quantities.
  void addSnapshot(const std::string& prefix, const MetaboliteStore::Snapshot& snapshot);

private:
  enum dtype {
    String=10,
    Strings=11,
    ArrayXd=12,
    Double=14
  };

  std::vector<uint8_t> data_;

  void append(dtype val) { data_.push_back(val); }
  void append(int val);
  void append(double val);
  void append(const std::string& str);
  void append(const std::vector<std::string>& strings);
};

// Publishes simulation state for an external viewer.
class Comms
{
public:
  static const std::string DEFAULT_ENDPOINT;

  Comms(const std::string& endpoint = DEFAULT_ENDPOINT);
  ~Comms() { sock_pub_.close(); }
  void broadcast(const MessageWrapper& msg) { sock_pub_.send(msg, zmq::send_flags::none); }

private:
  zmq::context_t ctx_;
  zmq::socket_t sock_pub_;
};
