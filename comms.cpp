#include <comms.h>
#include <iostream>

using namespace std;

void MessageWrapper::addField(const std::string& name, double val)
{
  append(name);
  append(dtype::Double);
  append(val);
}

void MessageWrapper::addField(const std::string& name, const Eigen::ArrayXd& arr)
{
  append(name);
  append(dtype::ArrayXd);
  append((int)arr.size());
  uint8_t const *dptr = reinterpret_cast<uint8_t const *>(arr.data());
  for (int i = 0; i < arr.size() * 8; ++i)
    data_.push_back(dptr[i]);
}

void MessageWrapper::addField(const std::string& name, const std::vector<std::string>& strings)
{
  append(name);
  append(dtype::Strings);
  append(strings);
}

void MessageWrapper::addSnapshot(const std::string& prefix, const MetaboliteStore::Snapshot& snapshot)
{
  addField(prefix + "_names", snapshot.names_);
  addField(prefix + "_quantities", snapshot.quantities_);
}

void MessageWrapper::append(int val)
{
  uint8_t* ptr = reinterpret_cast<uint8_t*>(&val);
  for (int i = 0; i < 4; ++i)
    data_.push_back(ptr[i]);
}

void MessageWrapper::append(double val)
{
  uint8_t* ptr = reinterpret_cast<uint8_t*>(&val);
  for (int i = 0; i < 8; ++i)
    data_.push_back(ptr[i]);
}

void MessageWrapper::append(const std::string& str)
{
  append((int)str.size());
  uint8_t const* ptr = reinterpret_cast<uint8_t const*>(str.data());
  for (size_t i = 0; i < str.size(); ++i)
    data_.push_back(ptr[i]);
}

void MessageWrapper::append(const std::vector<std::string>& strings)
{
  append((int)strings.size());
  for (const string& str : strings)
    append(str);
}

const std::string Comms::DEFAULT_ENDPOINT = "tcp://127.0.0.1:53269";

Comms::Comms(const std::string& endpoint) :
  sock_pub_(ctx_, zmq::socket_type::pub)
{
  sock_pub_.bind(endpoint);
  std::cout << "Connecting sock_pub_ to " << sock_pub_.get(zmq::sockopt::last_endpoint) << std::endl;
}
