/**
 * @file
 * @brief Umbrella include for every concrete AST node.
 */
#pragma once

#include "ast/Alias.h"
#include "ast/AssignStmt.h"
#include "ast/Attribute.h"
#include "ast/Binary.h"
#include "ast/BoolLiteral.h"
#include "ast/BreakStmt.h"
#include "ast/Call.h"
#include "ast/Compare.h"
#include "ast/ContinueStmt.h"
#include "ast/DefStmt.h"
#include "ast/ExprStmt.h"
#include "ast/FloatLiteral.h"
#include "ast/ForStmt.h"
#include "ast/FunctionDef.h"
#include "ast/IfStmt.h"
#include "ast/Import.h"
#include "ast/ImportFrom.h"
#include "ast/IntLiteral.h"
#include "ast/ListLiteral.h"
#include "ast/Module.h"
#include "ast/Name.h"
#include "ast/NoneLiteral.h"
#include "ast/PassStmt.h"
#include "ast/ReturnStmt.h"
#include "ast/Slice.h"
#include "ast/StringLiteral.h"
#include "ast/Subscript.h"
#include "ast/TupleLiteral.h"
#include "ast/Unary.h"
#include "ast/WhileStmt.h"
