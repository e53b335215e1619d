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
#include "donorrecord.h"

#include <algorithm>

DonorRecord::DonorRecord(std::initializer_list<Field> init)
{
    for (const auto& field : init)
        Set(field.first, field.second);
}

void DonorRecord::Set(const std::string& name, const std::string& value)
{
    auto it = std::find_if(fields.begin(), fields.end(),
                           [&](const Field& f) { return f.first == name; });
    if (it != fields.end())
        it->second = value;
    else
        fields.emplace_back(name, value);
}

std::optional<std::string> DonorRecord::Get(const std::string& name) const
{
    auto it = std::find_if(fields.begin(), fields.end(),
                           [&](const Field& f) { return f.first == name; });
    if (it == fields.end())
        return std::nullopt;
    return it->second;
}

bool DonorRecord::Has(const std::string& name) const
{
    return Get(name).has_value();
}

std::string DonorRecord::FirstName() const
{
    return Get(FIRST_NAME_FIELD).value_or(std::string());
}

std::string DonorRecord::LastName() const
{
    return Get(LAST_NAME_FIELD).value_or(std::string());
}

std::string DonorRecord::DisplayName() const
{
    std::string first = FirstName();
    std::string last = LastName();
    if (first.empty())
        return last;
    if (last.empty())
        return first;
    return first + " " + last;
}
