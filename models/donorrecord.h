/*
 * This file is part of Letterpress.
 * Copyright (C) 2025 Luisma Peramato
 *
 * Letterpress is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Letterpress is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Letterpress. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

inline constexpr const char* FIRST_NAME_FIELD = "First Name";
inline constexpr const char* LAST_NAME_FIELD = "Last Name";

// One recipient row. Fields keep the order in which they were supplied so
// that substitution visits them in spreadsheet column order.
class DonorRecord {
public:
    using Field = std::pair<std::string, std::string>;

    DonorRecord() = default;
    DonorRecord(std::initializer_list<Field> fields);

    // Sets a field, replacing the value in place if the name already exists.
    void Set(const std::string& name, const std::string& value);
    std::optional<std::string> Get(const std::string& name) const;
    bool Has(const std::string& name) const;

    const std::vector<Field>& Fields() const { return fields; }
    bool Empty() const { return fields.empty(); }

    std::string FirstName() const;
    std::string LastName() const;
    std::string DisplayName() const;

private:
    std::vector<Field> fields;
};
