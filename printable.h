#pragma once

#include <algorithm>
#include <sstream>
#include <string>

// Just gives the prefix option for free.
class Printable
{
public:
  virtual ~Printable() {}

  virtual std::string _str() const = 0;
  std::string str(const std::string& prefix="") const
  {
    std::istringstream iss(_str());
    std::ostringstream oss;
    for (std::string line; std::getline(iss, line); )
      oss << prefix << line + "\n";

    // Remove trailing newline.
    std::string result = oss.str();
    if (!result.empty() && result.back() == '\n')
      result.pop_back();
    return result;
  }
};
