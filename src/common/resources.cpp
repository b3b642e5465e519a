// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <cmath>
#include <limits>
#include <ostream>
#include <string>
#include <vector>

#include <nodeledger/resources.hpp>

#include <stout/foreach.hpp>
#include <stout/numify.hpp>
#include <stout/strings.hpp>

using std::ostream;
using std::pair;
using std::string;
using std::vector;

namespace nodeledger {

// Quantities are added, subtracted and compared in a fixed point
// representation with three decimal digits, as Mesos does for scalar
// resources, so that releasing what was allocated restores a ledger
// exactly. Non-finite values have no fixed point representation and
// are carried as they are; `validate()` rejects them.

static long long convertToFixed(double floatValue)
{
  return std::llround(floatValue * 1000);
}


static double convertToFloating(long long fixedValue)
{
  // NOTE: Integer division then modulus keeps the floating point
  // division to inputs in [0, 999].
  double quotient = static_cast<double>(fixedValue / 1000);
  double remainder = static_cast<double>(fixedValue % 1000) / 1000.0;

  return quotient + remainder;
}


static bool isFinite(double value)
{
  return !std::isnan(value) && !std::isinf(value);
}


static bool isZero(double value)
{
  return isFinite(value) && convertToFixed(value) == 0;
}


// Returns `left + sign * right`, rounded to the fixed point precision.
static double sum(double left, double right, double sign)
{
  if (!isFinite(left) || !isFinite(right)) {
    return left + sign * right;
  }

  long long result = convertToFixed(left);
  if (sign < 0) {
    result -= convertToFixed(right);
  } else {
    result += convertToFixed(right);
  }

  return convertToFloating(result);
}


const char Resources::MEMORY[] = "mem";
const char Resources::CPUS[] = "cpus";


Try<Resources> Resources::parse(const string& text)
{
  Resources result;

  foreach (const string& token, strings::tokenize(text, ";")) {
    vector<string> pair = strings::tokenize(token, ":");
    if (pair.size() != 2) {
      return Error("Failed to parse '" + token + "': missing or extra ':'");
    }

    Try<double> value = numify<double>(strings::trim(pair[1]));
    if (value.isError()) {
      return Error(
          "Failed to parse '" + pair[1] + "' to quantity: " + value.error());
    }

    if (std::isnan(value.get()) || std::isinf(value.get())) {
      return Error(
          "Failed to parse '" + pair[1] + "' to quantity:"
          " only finite values are allowed");
    }

    result.add(strings::trim(pair[0]), value.get());
  }

  return result;
}


Resources::Resources(
    const google::protobuf::RepeatedPtrField<Resource>& resources)
{
  foreach (const Resource& resource, resources) {
    add(resource.name(), resource.value());
  }
}


double Resources::get(const string& name) const
{
  // Don't bother binary searching since
  // we don't expect a large number of elements.
  foreach (const auto& quantity, quantities) {
    if (quantity.first == name) {
      return quantity.second;
    } else if (quantity.first > name) {
      // We can return early since we keep names in alphabetical order.
      break;
    }
  }

  return 0;
}


Option<Error> Resources::validate() const
{
  foreach (const auto& quantity, quantities) {
    if (std::isnan(quantity.second) || std::isinf(quantity.second)) {
      return Error(
          "Resource '" + quantity.first + "' has a non-finite quantity");
    }
  }

  return None();
}


Resources::operator google::protobuf::RepeatedPtrField<Resource>() const
{
  google::protobuf::RepeatedPtrField<Resource> result;

  foreach (const auto& quantity, quantities) {
    Resource* resource = result.Add();
    resource->set_name(quantity.first);
    resource->set_value(quantity.second);
  }

  return result;
}


bool Resources::operator==(const Resources& that) const
{
  if (size() != that.size()) {
    return false;
  }

  for (size_t i = 0; i < size(); ++i) {
    const pair<string, double>& left = quantities.at(i);
    const pair<string, double>& right = that.quantities.at(i);

    if (left.first != right.first) {
      return false;
    }

    if (isFinite(left.second) && isFinite(right.second)) {
      if (convertToFixed(left.second) != convertToFixed(right.second)) {
        return false;
      }
    } else if (left.second != right.second) {
      return false;
    }
  }

  return true;
}


bool Resources::operator!=(const Resources& that) const
{
  return !(*this == that);
}


Resources Resources::operator+(const Resources& that) const
{
  Resources result = *this;
  result += that;
  return result;
}


Resources Resources::operator-(const Resources& that) const
{
  Resources result = *this;
  result -= that;
  return result;
}


Resources Resources::operator-() const
{
  Resources result;
  result -= *this;
  return result;
}


Resources& Resources::operator+=(const Resources& that)
{
  merge(that, 1);
  return *this;
}


Resources& Resources::operator-=(const Resources& that)
{
  merge(that, -1);
  return *this;
}


void Resources::add(const string& name, double value)
{
  Resources single;
  single.quantities.push_back(std::make_pair(name, value));

  merge(single, 1);
}


void Resources::merge(const Resources& that, double sign)
{
  size_t leftIndex = 0u;
  size_t rightIndex = 0u;

  // Since quantities are sorted in alphabetical order, we can walk them
  // at the same time.
  while (leftIndex < size() && rightIndex < that.size()) {
    pair<string, double>& left_ = quantities.at(leftIndex);
    const pair<string, double>& right_ = that.quantities.at(rightIndex);

    if (left_.first < right_.first) {
      // Item exists in the left but not in the right.
      ++leftIndex;
    } else if (left_.first > right_.first) {
      // Item exists in the right but not in the left.
      // Insert absent entries in the alphabetical order.
      const double value = sum(0, right_.second, sign);
      if (!isZero(value)) {
        quantities.insert(
            quantities.begin() + leftIndex,
            std::make_pair(right_.first, value));
        ++leftIndex;
      }
      ++rightIndex;
    } else {
      // Item exists in both left and right.
      left_.second = sum(left_.second, right_.second, sign);
      if (isZero(left_.second)) {
        quantities.erase(quantities.begin() + leftIndex);
      } else {
        ++leftIndex;
      }
      ++rightIndex;
    }
  }

  // Copy the remaining items in `that`.
  while (rightIndex < that.size()) {
    const pair<string, double>& right_ = that.quantities.at(rightIndex);
    const double value = sum(0, right_.second, sign);
    if (!isZero(value)) {
      quantities.push_back(std::make_pair(right_.first, value));
    }
    ++rightIndex;
  }
}


ostream& operator<<(ostream& stream, const Resources& resources)
{
  if (resources.empty()) {
    stream << "{}";
    return stream;
  }

  // Print every significant digit, e.g., "mem:1048576" rather than
  // "mem:1.04858e+06", and restore the caller's precision afterwards.
  const std::streamsize precision =
    stream.precision(std::numeric_limits<double>::digits10);

  auto it = resources.begin();

  while (it != resources.end()) {
    stream << it->first << ':' << it->second;
    if (++it != resources.end()) {
      stream << "; ";
    }
  }

  stream.precision(precision);

  return stream;
}

} // namespace nodeledger {
