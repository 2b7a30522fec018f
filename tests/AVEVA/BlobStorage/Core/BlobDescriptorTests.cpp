// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStorage/Core/BlobDescriptor.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
using AVEVA::BlobStorage::Core::BlobDescriptor;

TEST(BlobDescriptorTests, Equality_SameFields_Equal)
{
    // Arrange
    const auto modified = std::chrono::system_clock::now();
    const BlobDescriptor first("a", 10, modified, "text/plain", "\"1\"");
    const BlobDescriptor second("a", 10, modified, "text/plain", "\"1\"");

    // Act & Assert
    ASSERT_EQ(first, second);
    ASSERT_FALSE(first == BlobDescriptor("a", 10, modified, "text/plain", "\"2\""));
}

TEST(BlobDescriptorTests, Constructor_NegativeSize_Throws)
{
    ASSERT_THROW(BlobDescriptor("a", -1), std::out_of_range);
}
