/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "json_util.hpp"

//-------------------------------------------------------------------------

class JsonSerializable
{
public:
    virtual ~JsonSerializable() noexcept = default;

    virtual void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const = 0;

protected:
    JsonSerializable() noexcept = default;
};

//-------------------------------------------------------------------------
