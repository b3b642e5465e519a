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

#ifndef __NODELEDGER_RESOURCES_HPP__
#define __NODELEDGER_RESOURCES_HPP__

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <google/protobuf/repeated_field.h>

#include <nodeledger/nodeledger.hpp>

#include <stout/error.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace nodeledger {

// A vector of named scalar quantities, e.g., [("cpus", 4), ("mem", 8192)].
//
// Quantities are kept to three decimal digits and added, subtracted
// and compared in fixed point, so that e.g. 0.1 + 0.2 - 0.1 - 0.2 is
// exactly zero. Absent entries imply a zero quantity of that resource,
// so entries that reach zero are dropped and two vectors compare equal
// whenever they agree on every name.
//
// Unlike the quantities a node reports, the result of arithmetic is
// NOT clamped: subtracting more than is present yields a negative
// entry. The ledger relies on this so that a delta applied to a node
// can always be reverted by applying its negation.
//
// A vector is invalid if any of its values is NaN or infinite. Such a
// vector can only be built from a protobuf (see `validate()`); the
// string parser rejects it.
class Resources
{
public:
  // Well known resource names.
  static const char MEMORY[];
  static const char CPUS[];

  // Parse an input string of semicolon separated "name:number" pairs.
  // Duplicate names are merged into one entry and whitespace around
  // names and numbers is trimmed. Negative numbers are allowed (a
  // capacity delta may shrink a node) but NaN and infinity are not.
  //
  // Example: "cpus:4;mem:8192", "mem:-1024"
  static Try<Resources> parse(const std::string& text);

  Resources() {}

  /*implicit*/ Resources(
      const google::protobuf::RepeatedPtrField<Resource>& resources);

  Resources(const Resources& that) = default;
  Resources(Resources&& that) = default;

  Resources& operator=(const Resources& that) = default;
  Resources& operator=(Resources&& that) = default;

  typedef std::vector<std::pair<std::string, double>>::const_iterator
    const_iterator;

  const_iterator begin() const { return quantities.begin(); }
  const_iterator end() const { return quantities.end(); }

  size_t size() const { return quantities.size(); }
  bool empty() const { return quantities.empty(); }

  // Returns the quantity of the given name, or zero if absent.
  double get(const std::string& name) const;

  double memory() const { return get(MEMORY); }
  double cpus() const { return get(CPUS); }

  // Returns an error if any quantity is not finite.
  Option<Error> validate() const;

  operator google::protobuf::RepeatedPtrField<Resource>() const;

  bool operator==(const Resources& that) const;
  bool operator!=(const Resources& that) const;

  Resources operator+(const Resources& that) const;
  Resources operator-(const Resources& that) const;
  Resources operator-() const;

  Resources& operator+=(const Resources& that);
  Resources& operator-=(const Resources& that);

private:
  void add(const std::string& name, double value);

  // Walks both (sorted) vectors at once, adding `sign * that` to this.
  void merge(const Resources& that, double sign);

  // List of name quantity pairs sorted by name.
  std::vector<std::pair<std::string, double>> quantities;
};


std::ostream& operator<<(std::ostream& stream, const Resources& resources);

} // namespace nodeledger {

#endif // __NODELEDGER_RESOURCES_HPP__
