//
// Created by nodesync on 2026/10/18.
//

#pragma once

#define DISALLOW_COPY_MOVE_AND_ASSIGN(TypeName)                                \
  TypeName(const TypeName&) = delete;                                          \
  TypeName& operator=(const TypeName&) = delete;                               \
  TypeName(TypeName&&) = delete;                                               \
  TypeName& operator=(TypeName&&) = delete
